#pragma once

#include "xsel/errors.h"
#include "xsel/selector.h"
#include "xsel/selector_list.h"
#include "xsel/version.h"
