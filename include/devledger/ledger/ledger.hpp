#pragma once

#include "composite_key.hpp"
#include "key_value_ledger.hpp"
#include "memory_ledger.hpp"

namespace devledger::ledger {
    // Aggregates ledger headers under devledger::ledger
}
