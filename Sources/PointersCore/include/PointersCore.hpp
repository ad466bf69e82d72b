#pragma once

// PointersCore - polymorphic foreign keys for SQLite
//
// Usage:
//   #include <PointersCore.hpp>
//
//   int main() {
//       pointers::pointers_db db;  // in-memory, or db("path.db")
//
//       db.migrate(pointers::direction::up, [](pointers::migration& m) {
//           m.init_pointers();
//           m.create_pointable_table("posts", "01F8MECHZX3TBDSZ7XRADM79XV", [](auto& t) {
//               t.add("title", pointers::column_type::text);
//           });
//           m.create_pointable_table("likes", "01F8MECHZX3TBDSZ7XRADM79XW", [&](auto& t) {
//               t.add("target", m.strong_pointer(), {.nullable = false});
//           });
//       });
//
//       auto post = pointers::ulid::generate();
//       db.insert("posts", {{"id", post.dump()}, {"title", "hello"}});
//       // posts row now has a pointer; deleting it deletes every like of it
//   }

#include "pointers/log.hpp"
#include "pointers/ulid.hpp"
#include "pointers/types.hpp"
#include "pointers/db.hpp"
#include "pointers/config.hpp"
#include "pointers/references.hpp"
#include "pointers/schema.hpp"
#include "pointers/registry.hpp"
#include "pointers/pointer_store.hpp"
#include "pointers/trigger.hpp"
#include "pointers/ulid_functions.hpp"
#include "pointers/pointers.hpp"
#include "pointers/migration.hpp"
