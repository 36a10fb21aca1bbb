#pragma once

#include "model/device.h"
#include "model/feedback.h"
#include "model/online_status.h"
