#pragma once

#include <custodia/schema/ledger_event_type.hpp>
#include <scale/scale.hpp>

SCALE_DEFINE_ENUM_VALUE_LIST(
    custodia::schema,
    ledger_event_type_t,
    custodia::schema::ledger_event_type_t::evidence_registered,
    custodia::schema::ledger_event_type_t::custody_event_logged,
    custodia::schema::ledger_event_type_t::verification_passed,
    custodia::schema::ledger_event_type_t::tamper_detected,
    custodia::schema::ledger_event_type_t::verification_attested,
    custodia::schema::ledger_event_type_t::policy_violation)
