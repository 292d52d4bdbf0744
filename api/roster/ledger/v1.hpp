#pragma once

// Message types only; gRPC stubs live in the *.grpc.pb.h headers.
#include "roster/ledger/v1/types.pb.h"

#include "roster/ledger/v1/admin_service.pb.h"
#include "roster/ledger/v1/roster_service.pb.h"
