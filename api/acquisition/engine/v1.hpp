#pragma once

#include "acquisition/engine/core/v1/credential.pb.h"
#include "acquisition/engine/core/v1/job.pb.h"

#include "acquisition/engine/services/v1/acquisition_service.pb.h"
#include "acquisition/engine/services/v1/credential_service.pb.h"

#include "acquisition/engine/services/v1/acquisition_service.grpc.pb.h"
#include "acquisition/engine/services/v1/credential_service.grpc.pb.h"
