#pragma once

#include "registry/v1/types.pb.h"

#include "registry/v1/registry_service.pb.h"
#include "registry/v1/registry_service.grpc.pb.h"
