#pragma once

#include "runbox/config.hpp"
#include "runbox/dispatcher.hpp"
#include "runbox/errors.hpp"
#include "runbox/format.hpp"
#include "runbox/imports.hpp"
#include "runbox/isolate.hpp"
#include "runbox/mcp.hpp"
#include "runbox/packager.hpp"
#include "runbox/process_sandbox.hpp"
#include "runbox/provenance.hpp"
#include "runbox/request.hpp"
#include "runbox/resolver.hpp"
#include "runbox/response.hpp"
#include "runbox/service.hpp"
#include "runbox/utils.hpp"
#include "runbox/value.hpp"
