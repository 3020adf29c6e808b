#pragma once

#include "roster/v1/roster_service.pb.h"
