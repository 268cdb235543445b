#pragma once

#include "model/progress_sample.h"
#include "model/session_result.h"
#include "model/session_state.h"
#include "model/transfer_kind.h"
#include "model/transfer_metadata.h"
#include "model/transfer_outcome.h"
