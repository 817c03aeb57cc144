#pragma once

/// IoT module - device registry, data records and their verification

#include "contract.hpp"
#include "data_record.hpp"
#include "data_record_store.hpp"
#include "device.hpp"
#include "device_registry.hpp"
#include "verification_workflow.hpp"
