#pragma once

#include <custodia/schema/tamper_source.hpp>
#include <scale/scale.hpp>

SCALE_DEFINE_ENUM_VALUE_LIST(custodia::schema,
                             tamper_source_t,
                             custodia::schema::tamper_source_t::unknown,
                             custodia::schema::tamper_source_t::verification,
                             custodia::schema::tamper_source_t::risk_scoring)
