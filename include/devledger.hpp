#pragma once

// devledger facade
// Composes the world-state ledger, its storage backends and the IoT module

#include "devledger/common/error.hpp"
#include "devledger/iot/iot.hpp"
#include "devledger/ledger/ledger.hpp"
#include "devledger/storage/file_store.hpp"
#include "devledger/storage/sqlite_store.hpp"
