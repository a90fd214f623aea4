// SPDX-License-Identifier: Apache-2.0
#pragma once

#include "cuecraft/edit/edit_pipeline.hpp"
#include "cuecraft/silence/silence_compactor.hpp"
#include "cuecraft/silence/time_interval.hpp"
#include "cuecraft/subtitle/style.hpp"
#include "cuecraft/subtitle/subtitle.hpp"
#include "cuecraft/utility/caf_helpers.hpp"
#include "cuecraft/utility/json_store.hpp"
