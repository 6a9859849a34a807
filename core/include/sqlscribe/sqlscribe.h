#pragma once

#include "sqlscribe/condition.h"
#include "sqlscribe/dialect.h"
#include "sqlscribe/errors.h"
#include "sqlscribe/expression.h"
#include "sqlscribe/functions.h"
#include "sqlscribe/query.h"
#include "sqlscribe/schema.h"
#include "sqlscribe/table.h"
#include "sqlscribe/version.h"
