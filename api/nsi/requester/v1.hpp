#pragma once

#include "nsi/requester/v1/envelope.pb.h"
#include "nsi/requester/v1/connection.pb.h"
#include "nsi/requester/v1/requester_service.pb.h"

#include "nsi/requester/v1/requester_service.grpc.pb.h"
