/// @file jsonrev.hpp
/// @brief Umbrella header for the jsonrev-cpp library.
///
/// Include this single header for access to all public types:
/// Value, Path, EditOp, diff/apply_edits, Revision, RevisionStore,
/// ChainManager, the JSON text form and the revision codec.

#pragma once

#include <jsonrev-cpp/chain.hpp>
#include <jsonrev-cpp/codec.hpp>
#include <jsonrev-cpp/diff.hpp>
#include <jsonrev-cpp/edit.hpp>
#include <jsonrev-cpp/error.hpp>
#include <jsonrev-cpp/json.hpp>
#include <jsonrev-cpp/patch.hpp>
#include <jsonrev-cpp/path.hpp>
#include <jsonrev-cpp/revision.hpp>
#include <jsonrev-cpp/store.hpp>
#include <jsonrev-cpp/value.hpp>
