#pragma once

#include "datastream/store/v1/assignment.pb.h"
#include "datastream/store/v1/datastream.pb.h"

#include "datastream/store/v1/dms_service.pb.h"
#include "datastream/store/v1/dms_service.grpc.pb.h"
