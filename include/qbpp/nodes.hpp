// Copyright (c) 2024 liudegui. MIT License.
//
// All syntax tree node headers.

#pragma once

#include "qbpp/clause_node.hpp"
#include "qbpp/identifier_node.hpp"
#include "qbpp/operation_node.hpp"
#include "qbpp/operator_node.hpp"
#include "qbpp/query_node.hpp"
#include "qbpp/schema_node.hpp"
#include "qbpp/value_node.hpp"
