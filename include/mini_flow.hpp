#pragma once

#include "mini_flow/builder.hpp"
#include "mini_flow/codec.hpp"
#include "mini_flow/compiled_workflow.hpp"
#include "mini_flow/condition.hpp"
#include "mini_flow/config_node.hpp"
#include "mini_flow/engine.hpp"
#include "mini_flow/errors.hpp"
#include "mini_flow/execution.hpp"
#include "mini_flow/execution_store.hpp"
#include "mini_flow/graph.hpp"
#include "mini_flow/interfaces.hpp"
#include "mini_flow/logging.hpp"
#include "mini_flow/run_executor.hpp"
#include "mini_flow/serialization.hpp"
#include "mini_flow/templates.hpp"
#include "mini_flow/thread_pool.hpp"
#include "mini_flow/transforms.hpp"
#include "mini_flow/validate.hpp"
