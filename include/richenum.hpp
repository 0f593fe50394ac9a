#pragma once

/*
===============================================================================
richenum — Public API Entry Point
===============================================================================

Smart enumerations: derive `T` from `richenum::EnumBase<T>`, list the members
in `T::Members`, and the type gets a per-type registry with strict and
optional lookups, index-ordered views, flag helpers and JSON round-tripping
of its entries.

Everything declared in the richenum namespace is part of the public API.
The lookup engine (richenum::lookup) and Registry are exposed for tooling,
ordinary users only need EnumBase.
===============================================================================
*/

#include <richenum/config.hpp>
#include <richenum/error.hpp>
#include <richenum/oid.hpp>
#include <richenum/text.hpp>
#include <richenum/entry.hpp>
#include <richenum/definition.hpp>
#include <richenum/member.hpp>
#include <richenum/registry.hpp>
#include <richenum/lookup.hpp>
#include <richenum/flags.hpp>
#include <richenum/codec.hpp>
#include <richenum/enum_base.hpp>
