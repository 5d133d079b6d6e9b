#pragma once

#include <keycase/core/Key.h>
#include <keycase/core/Value.h>
#include <keycase/core/Record.h>
#include <keycase/core/records.h>
#include <keycase/core/case.h>
#include <keycase/core/convert.h>
#include <keycase/support/logging.h>

