#pragma once

#include <custodia/schema/evidence_status.hpp>
#include <scale/scale.hpp>

SCALE_DEFINE_ENUM_VALUE_LIST(custodia::schema,
                             evidence_status_t,
                             custodia::schema::evidence_status_t::unset,
                             custodia::schema::evidence_status_t::registered,
                             custodia::schema::evidence_status_t::flagged,
                             custodia::schema::evidence_status_t::verified)
