#pragma once

#include "model/add_device.h"
#include "model/operation.h"
#include "model/operation_type.h"
#include "model/remove_device.h"
#include "model/set_device_enabled.h"
