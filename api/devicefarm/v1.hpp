#pragma once

#include "devicefarm/v1/requests.pb.h"
#include "devicefarm/v1/resources.pb.h"
