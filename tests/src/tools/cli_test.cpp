#include <gtest/gtest.h>
#include <custodia/fingerprint/fingerprint.hpp>
#include <custodia/testing/common.hpp>

#include <nlohmann/json.hpp>

#include <array>
#include <cstdio>
#include <filesystem>
#include <fstream>
#include <string>
#include <string_view>
#include <utility>

#include <sys/wait.h>

#ifndef CUSTODIA_CLI_PATH
#define CUSTODIA_CLI_PATH ""
#endif

namespace {

using json = nlohmann::json;

std::string shell_quote(const std::string_view value) {
  auto out = std::string{"'"};
  for (const auto ch : value) {
    if (ch == '\'') {
      out += "'\\''";
    } else {
      out.push_back(ch);
    }
  }
  out.push_back('\'');
  return out;
}

std::pair<int, std::string> run_capture(const std::string& command) {
  auto buffer = std::array<char, 256>{};
  auto output = std::string{};
  auto* pipe = popen(command.c_str(), "r");
  if (pipe == nullptr) {
    return {-1, {}};
  }
  while (fgets(buffer.data(), static_cast<int>(buffer.size()), pipe) !=
         nullptr) {
    output += buffer.data();
  }
  auto status = pclose(pipe);
  if (status == -1) {
    return {-1, output};
  }
  if (WIFEXITED(status) == 0) {
    return {-1, output};
  }
  return {WEXITSTATUS(status), output};
}

/// Runs the CLI against one scratch ledger directory.
class cli_session final {
 public:
  explicit cli_session(const std::string_view prefix)
      : dir_{custodia::testing::make_db_path(prefix)} {
    std::filesystem::create_directories(dir_);
  }

  cli_session(const cli_session&) = delete;
  cli_session& operator=(const cli_session&) = delete;

  ~cli_session() { custodia::testing::remove_path(dir_); }

  std::pair<int, std::string> run(const std::string& args) const {
    auto command = shell_quote(CUSTODIA_CLI_PATH) + " " + args +
                   " --db-path " + shell_quote(dir_ + "/db") +
                   " --log-file " + shell_quote(dir_ + "/custodia.log") +
                   " 2>/dev/null";
    return run_capture(command);
  }

  std::pair<int, json> run_json(const std::string& args) const {
    auto [exit_code, output] = run(args);
    return {exit_code, json::parse(output, nullptr, false)};
  }

  std::string write_file(const std::string& name,
                         const std::string& content) const {
    auto path = dir_ + "/" + name;
    auto out = std::ofstream{path, std::ios::binary};
    out << content;
    return path;
  }

 private:
  std::string dir_;
};

}  // namespace

TEST(cli, fingerprint_matches_library_digest) {
  ASSERT_FALSE(std::string{CUSTODIA_CLI_PATH}.empty());
  auto session = cli_session{"custodia_cli_fingerprint"};

  auto [exit_code, body] = session.run_json("fingerprint --text " +
                                            shell_quote("chain of custody"));
  ASSERT_EQ(exit_code, 0);
  EXPECT_EQ(body["result"]["fingerprint"],
            custodia::schema::to_fingerprint_string(
                custodia::fingerprint::digest_string("chain of custody")));

  auto [json_exit, structured] =
      session.run_json("fingerprint --json " + shell_quote(R"({"b":1,"a":2})"));
  ASSERT_EQ(json_exit, 0);
  EXPECT_EQ(structured["result"]["fingerprint"],
            custodia::schema::to_fingerprint_string(
                custodia::fingerprint::digest_string(R"({"a":2,"b":1})")));
}

TEST(cli, custody_lifecycle_through_the_command_line) {
  auto session = cli_session{"custodia_cli_lifecycle"};
  auto image = session.write_file("image.bin", "sector dump");

  auto [registered_exit, registered] = session.run_json(
      "register --file " + shell_quote(image) +
      " --case-id CR-2024-TEST --collector officer-1");
  ASSERT_EQ(registered_exit, 0);
  EXPECT_EQ(registered["result"]["id"], 1);
  EXPECT_EQ(registered["result"]["status"], "REGISTERED");

  auto [skip_exit, skipped] = session.run_json(
      "log --evidence-id 1 --action ANALYZED --handler analyst-1");
  EXPECT_EQ(skip_exit, 2);
  EXPECT_EQ(skipped["error"], "InvalidCustodyOrder");
  EXPECT_EQ(skipped["recorded"]["action"], "VIOLATION");

  auto [sealed_exit, sealed] = session.run_json(
      "log --evidence-id 1 --action SEALED --handler officer-1 --details " +
      shell_quote(R"({"bag":"B-17"})"));
  EXPECT_EQ(sealed_exit, 0);
  EXPECT_EQ(sealed["result"]["eventIndex"], 2);

  auto [verify_exit, verified] = session.run_json(
      "verify --evidence-id 1 --file " + shell_quote(image) +
      " --verifier lab-1");
  EXPECT_EQ(verify_exit, 0);
  EXPECT_EQ(verified["result"]["status"], "VERIFIED");

  auto altered = session.write_file("altered.bin", "sector dump!");
  auto [tamper_exit, tampered] = session.run_json(
      "verify --evidence-id 1 --file " + shell_quote(altered) +
      " --verifier lab-2");
  EXPECT_EQ(tamper_exit, 2);
  EXPECT_EQ(tampered["result"]["status"], "FLAGGED");

  auto [tamper_list_exit, tamper_list] =
      session.run_json("tamper-events --evidence-id 1");
  EXPECT_EQ(tamper_list_exit, 0);
  ASSERT_EQ(tamper_list["result"].size(), 1u);
  EXPECT_EQ(tamper_list["result"][0]["detectedBy"], "VERIFICATION");

  auto [show_exit, shown] = session.run_json("show --evidence-id 1");
  EXPECT_EQ(show_exit, 0);
  EXPECT_EQ(shown["result"]["status"], "FLAGGED");
  EXPECT_EQ(shown["result"]["custody"].size(), 4u);
  EXPECT_EQ(shown["result"]["custody"][1]["action"], "VIOLATION");
  EXPECT_EQ(shown["result"]["custody"][2]["action"], "SEALED");
  EXPECT_EQ(shown["result"]["currentStep"], "VERIFIED");

  auto [log_exit, replay] = session.run_json("verify-log");
  EXPECT_EQ(log_exit, 0);
  EXPECT_EQ(replay["ok"], true);
}

TEST(cli, attestation_requires_registered_verifier) {
  auto session = cli_session{"custodia_cli_attest"};
  ASSERT_EQ(session
                .run("register --fingerprint 0x" + std::string(64, 'a') +
                     " --case-id CR-1 --collector officer-1")
                .first,
            0);

  EXPECT_EQ(session.run("attest --evidence-id 1 --verifier v1 --verified true")
                .first,
            2);
  EXPECT_EQ(session.run("register-verifier --verifier v1").first, 0);
  auto [exit_code, attested] = session.run_json(
      "attest --evidence-id 1 --verifier v1 --verified true");
  EXPECT_EQ(exit_code, 0);
  EXPECT_EQ(attested["result"], 0);

  auto [show_exit, shown] = session.run_json("show --evidence-id 1");
  EXPECT_EQ(shown["result"]["attestations"]["total"], 1);
  EXPECT_EQ(shown["result"]["attestations"]["confirmed"], 1);
}

TEST(cli, non_utf8_identities_are_printed_with_replacement) {
  auto session = cli_session{"custodia_cli_bytes"};
  auto collector = std::string{"officer-\xff"};

  auto [registered_exit, registered] = session.run_json(
      "register --fingerprint 0x" + std::string(64, 'b') +
      " --case-id " + shell_quote("CR-\xc3") + " --collector " +
      shell_quote(collector));
  ASSERT_EQ(registered_exit, 0);
  EXPECT_EQ(registered["result"]["collector"], "officer-\xef\xbf\xbd");
  EXPECT_EQ(registered["result"]["caseId"], "CR-\xef\xbf\xbd");

  auto [log_exit, logged] = session.run_json(
      "log --evidence-id 1 --action ACCESSED --handler " +
      shell_quote(collector));
  EXPECT_EQ(log_exit, 0);

  auto [show_exit, shown] = session.run_json("show --evidence-id 1");
  ASSERT_EQ(show_exit, 0);
  EXPECT_EQ(shown["result"]["custody"].size(), 2u);
  EXPECT_EQ(shown["result"]["activeCheckout"]["handler"],
            "officer-\xef\xbf\xbd");

  EXPECT_EQ(session.run("events").first, 0);
}

TEST(cli, usage_errors_exit_with_one) {
  auto session = cli_session{"custodia_cli_usage"};
  EXPECT_EQ(session.run("").first, 1);
  EXPECT_EQ(session.run("teleport").first, 1);
  EXPECT_EQ(session.run("log --evidence-id 1 --handler h").first, 1);
  EXPECT_EQ(session.run("register --fingerprint 0x12 --case-id C --collector A")
                .first,
            1);
  EXPECT_EQ(session.run("fingerprint --json " + shell_quote("{not json")).first,
            1);
  EXPECT_EQ(session.run("show --evidence-id 5 --log-level loud").first, 1);
  EXPECT_EQ(session.run("show --evidence-id 5").first, 2);
}
