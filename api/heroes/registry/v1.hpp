#pragma once

#include "heroes/registry/v1/types.pb.h"

#include "heroes/registry/v1/admin_service.pb.h"
#include "heroes/registry/v1/instruction_service.pb.h"

#include "heroes/registry/v1/admin_service.grpc.pb.h"
#include "heroes/registry/v1/instruction_service.grpc.pb.h"
