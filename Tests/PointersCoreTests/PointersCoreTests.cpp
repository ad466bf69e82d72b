#include <PointersCore.hpp>
#include <cassert>
#include <iostream>
#include <filesystem>
#include <algorithm>

#include "UlidTests.hpp"
#include "ConfigTests.hpp"

using pointers::column_type;
using pointers::direction;
using pointers::migration;
using pointers::pointers_db;
using pointers::ulid;

// ============================================================================
// Fixtures
// ============================================================================

constexpr const char* articles_id = "01F8MECHZX3TBDSZ7XRADM79XV";
constexpr const char* likes_id = "01F8MECHZX3TBDSZ7XRADM79XW";
constexpr const char* bookmarks_id = "01F8MECHZX3TBDSZ7XRADM79XX";
constexpr const char* pins_id = "01F8MECHZX3TBDSZ7XRADM79XY";
constexpr const char* comments_id = "01F8MECHZX3TBDSZ7XRADM79XZ";

struct Article {
    static constexpr std::string_view table_name = "articles";
    static constexpr std::string_view table_id = "01F8MECHZX3TBDSZ7XRADM79XV";
};

template<typename E, typename F>
bool throws(F&& fn) {
    try {
        fn();
    } catch (const E&) {
        return true;
    }
    return false;
}

void init(pointers_db& db) {
    db.migrate(direction::up, [](migration& m) {
        m.init_pointers();
    });
}

// articles(title) plus three tables pointing at articles rows:
// likes (strong), bookmarks (weak), pins (unbreakable)
void create_article_tables(pointers_db& db) {
    db.migrate(direction::up, [](migration& m) {
        m.init_pointers();
        m.create_pointable_table("articles", articles_id, [](auto& t) {
            t.add("title", column_type::text, {.nullable = false});
        });
        m.create_pointable_table("likes", likes_id, [&](auto& t) {
            t.add("target", m.strong_pointer(), {.nullable = false});
        });
        m.create_pointable_table("bookmarks", bookmarks_id, [&](auto& t) {
            t.add("target", m.weak_pointer());
        });
        m.create_pointable_table("pins", pins_id, [&](auto& t) {
            t.add("target", m.unbreakable_pointer(), {.nullable = false});
        });
    });
}

ulid insert_article(pointers_db& db, const std::string& title) {
    auto id = ulid::generate();
    db.insert("articles", {{"id", id.dump()}, {"title", title}});
    return id;
}

ulid insert_ref(pointers_db& db, const std::string& table, const ulid& target) {
    auto id = ulid::generate();
    db.insert(table, {{"id", id.dump()}, {"target", target.dump()}});
    return id;
}

// ============================================================================
// Test: init_pointers
// ============================================================================

void test_init_pointers() {
    std::cout << "Testing init_pointers..." << std::endl;

    pointers_db db;
    assert(!db.is_initialized());

    init(db);
    assert(db.is_initialized());
    assert(db.db().table_exists("pointers_table"));
    assert(db.db().table_exists("pointers_pointer"));
    assert(db.db().index_exists("pointers_table_table_index"));
    assert(db.db().index_exists("pointers_pointer_table_id_index"));
    assert(db.triggers().function_installed());
    assert(db.triggers().has_trigger("pointers_table"));

    // The registry registers itself under the fixed id, without a pointer
    auto records = db.registry().all();
    assert(records.size() == 1);
    assert(records[0].table == "pointers_table");
    assert(records[0].id == ulid::cast(pointers::registry_table_id));
    assert(db.pointers().count() == 0);

    auto columns = db.db().get_table_info("pointers_pointer");
    assert(columns.size() == 2);
    assert(columns["id"] == "BLOB");
    assert(columns["table_id"] == "BLOB");

    // Running it again changes nothing
    init(db);
    assert(db.registry().all().size() == 1);
    assert(db.db().triggers_with_prefix("insert_pointer_").size() == 1);
    assert(db.db().triggers_with_prefix("delete_pointer_").size() == 1);

    std::cout << "  init_pointers test passed!" << std::endl;
}

// ============================================================================
// Test: init_pointers down
// ============================================================================

void test_init_pointers_down() {
    std::cout << "Testing init_pointers down..." << std::endl;

    pointers_db db;
    db.migrate(direction::up, [](migration& m) {
        m.init_pointers();
        m.create_pointable_table("articles", articles_id, [](auto& t) {
            t.add("title", column_type::text);
        });
    });
    insert_article(db, "Gone soon");

    db.migrate(direction::down, [](migration& m) {
        assert(m.dir() == direction::down);
        m.drop_pointable_table("articles", articles_id);
        m.init_pointers();
    });

    assert(!db.is_initialized());
    assert(!db.db().table_exists("articles"));
    assert(!db.db().table_exists("pointers_table"));
    assert(!db.db().table_exists("pointers_pointer"));
    assert(!db.db().index_exists("pointers_table_table_index"));
    assert(db.db().triggers_with_prefix("insert_pointer_").empty());
    assert(db.db().triggers_with_prefix("delete_pointer_").empty());
    assert(!db.triggers().function_installed());

    // And back up again
    init(db);
    assert(db.is_initialized());
    assert(db.registry().all().size() == 1);

    std::cout << "  init_pointers down test passed!" << std::endl;
}

// ============================================================================
// Test: registry id stability
// ============================================================================

void test_registry_stability() {
    std::cout << "Testing registry id stability..." << std::endl;

    pointers_db db;
    init(db);

    auto first = ulid::cast(articles_id);
    auto second = ulid::cast(comments_id);

    db.migrate(direction::up, [&](migration& m) {
        assert(m.insert_table_record(first, "articles") == first);
        // A second id for the same name loses
        assert(m.insert_table_record(second, "articles") == first);
    });

    assert(db.registry().resolve("articles") == first);
    assert(db.registry().name_of(first) == "articles");
    assert(!db.registry().name_of(second).has_value());

    // Registering a table gives its id a pointer tagged with the registry
    auto table_pointer = db.pointers().find(first);
    assert(table_pointer.has_value());
    assert(table_pointer->table_id == ulid::cast(pointers::registry_table_id));
    assert(!db.pointers().find(second).has_value());

    assert(db.registry().deregister(first));
    assert(!db.registry().deregister(first));
    assert(!db.registry().find("articles").has_value());
    assert(!db.pointers().find(first).has_value());

    assert(throws<pointers::unknown_table>([&] { db.registry().resolve("articles"); }));

    std::cout << "  Registry stability test passed!" << std::endl;
}

// ============================================================================
// Test: typed table schemas
// ============================================================================

void test_typed_schema() {
    std::cout << "Testing typed table schemas..." << std::endl;

    pointers_db db;
    db.migrate(direction::up, [](migration& m) {
        m.init_pointers();
        m.create_pointable_table<Article>({}, [](auto& t) {
            t.add("title", column_type::text);
        });
    });

    assert(db.registry().resolve<Article>() == ulid::cast(Article::table_id));
    assert(db.triggers().has_trigger("articles"));

    std::cout << "  Typed schema test passed!" << std::endl;
}

// ============================================================================
// Test: every insert creates its pointer
// ============================================================================

void test_insert_creates_pointer() {
    std::cout << "Testing pointer creation on insert..." << std::endl;

    pointers_db db;
    create_article_tables(db);
    auto articles = ulid::cast(articles_id);

    // One pointer per registered table so far
    assert(db.pointers().count() == 4);

    auto row = insert_article(db, "First");
    auto pointer = db.pointers().find(row);
    assert(pointer.has_value());
    assert(pointer->id == row);
    assert(pointer->table_id == articles);
    assert(db.pointers().count_for(articles) == 1);

    std::vector<pointers::values_t> rows;
    for (int i = 0; i < 3; ++i) {
        rows.push_back({{"id", ulid::generate().dump()}, {"title", "Bulk " + std::to_string(i)}});
    }
    assert(db.insert_all("articles", rows) == 3);
    assert(db.pointers().count_for(articles) == 4);

    // An upsert on an existing row keeps the single pointer
    int written = db.insert("articles", {{"id", row.dump()}, {"title", "First, edited"}},
                            pointers::conflict_policy::replace_all_except({"id"}));
    assert(written == 1);
    assert(db.pointers().count_for(articles) == 4);
    auto found = db.find("articles", row);
    assert(found.has_value());
    assert(std::get<std::string>(found->at("title")) == "First, edited");

    written = db.insert("articles", {{"id", row.dump()}, {"title", "ignored"}},
                        pointers::conflict_policy::do_nothing({"id"}));
    assert(written == 0);
    assert(std::get<std::string>(db.find("articles", row)->at("title")) == "First, edited");

    // A plain duplicate is still a constraint error, and leaves nothing behind
    auto before = db.pointers().count();
    assert(throws<pointers::db_error>([&] {
        db.insert("articles", {{"id", row.dump()}, {"title", "dup"}});
    }));
    assert(db.pointers().count() == before);

    // A failing insert takes its pointer with it
    auto rejected = ulid::generate();
    assert(throws<pointers::db_error>([&] {
        db.insert("articles", {{"id", rejected.dump()}, {"title", nullptr}});
    }));
    assert(!db.pointers().find(rejected).has_value());

    std::cout << "  Pointer creation test passed!" << std::endl;
}

// ============================================================================
// Test: inserts into unregistered tables are refused
// ============================================================================

void test_unregistered_table_rejected() {
    std::cout << "Testing unregistered table rejection..." << std::endl;

    pointers_db db;
    create_article_tables(db);
    auto kept = insert_article(db, "Kept");

    // Registry row removed, triggers left in place
    db.migrate(direction::up, [](migration& m) {
        m.delete_table_record(articles_id);
    });
    assert(db.triggers().has_trigger("articles"));
    // Pointers tagged with the table went with its registry row
    assert(!db.pointers().find(kept).has_value());

    auto id = ulid::generate();
    bool caught = false;
    try {
        db.insert("articles", {{"id", id.dump()}, {"title", "Refused"}});
    } catch (const pointers::unregistered_table_insert& e) {
        caught = true;
        assert(e.table() == "articles");
        assert(std::string(e.what()).find("does not participate") != std::string::npos);
    }
    assert(caught);
    assert(!db.find("articles", id).has_value());
    assert(!db.pointers().find(id).has_value());

    // A table carrying triggers that was never registered at all
    db.db().execute("CREATE TABLE orphans (id BLOB PRIMARY KEY NOT NULL)");
    db.migrate(direction::up, [](migration& m) {
        m.create_pointer_trigger("orphans");
    });
    caught = false;
    try {
        db.insert("orphans", {{"id", ulid::generate().dump()}});
    } catch (const pointers::unregistered_table_insert& e) {
        caught = true;
        assert(e.table() == "orphans");
    }
    assert(caught);

    // The refusal aborts the whole write block
    auto comment = ulid::generate();
    db.migrate(direction::up, [](migration& m) {
        m.create_pointable_table("comments", comments_id, [](auto& t) {
            t.add("body", column_type::text);
        });
    });
    assert(throws<pointers::unregistered_table_insert>([&] {
        db.write([&] {
            db.insert("comments", {{"id", comment.dump()}, {"body", "written"}});
            db.insert("orphans", {{"id", ulid::generate().dump()}});
        });
    }));
    assert(!db.find("comments", comment).has_value());
    assert(!db.pointers().find(comment).has_value());

    std::cout << "  Unregistered table rejection test passed!" << std::endl;
}

// ============================================================================
// Test: trigger installation is idempotent
// ============================================================================

void test_trigger_idempotent() {
    std::cout << "Testing trigger idempotence..." << std::endl;

    pointers_db db;
    create_article_tables(db);

    db.migrate(direction::up, [](migration& m) {
        m.create_pointer_trigger("articles");
        m.create_pointer_trigger("articles");
        m.create_pointer_trigger_function();
    });

    auto names = db.db().triggers_with_prefix("insert_pointer_");
    assert(std::count(names.begin(), names.end(), "insert_pointer_articles") == 1);
    assert(db.db().trigger_exists("delete_pointer_articles"));

    auto row = insert_article(db, "Once");
    assert(db.pointers().count_for(ulid::cast(articles_id)) == 1);
    assert(db.pointers().find(row).has_value());

    // Without triggers rows get no pointer
    db.migrate(direction::up, [](migration& m) {
        m.drop_pointer_trigger("articles");
        m.drop_pointer_trigger("articles");
    });
    assert(!db.triggers().has_trigger("articles"));
    auto untracked = insert_article(db, "Untracked");
    assert(!db.pointers().find(untracked).has_value());

    std::cout << "  Trigger idempotence test passed!" << std::endl;
}

// ============================================================================
// Test: the trigger function depends on nothing but the connection
// ============================================================================

void test_drop_function_drops_triggers() {
    std::cout << "Testing trigger function removal..." << std::endl;

    pointers_db db;
    create_article_tables(db);
    assert(db.db().triggers_with_prefix("insert_pointer_").size() == 5);

    db.migrate(direction::up, [](migration& m) {
        m.drop_pointer_trigger_function();
    });
    assert(!db.triggers().function_installed());
    assert(db.db().triggers_with_prefix("insert_pointer_").empty());
    assert(db.db().triggers_with_prefix("delete_pointer_").empty());

    // Dropping twice is fine
    db.migrate(direction::up, [](migration& m) {
        m.drop_pointer_trigger_function();
    });

    std::cout << "  Trigger function removal test passed!" << std::endl;
}

// ============================================================================
// Test: strong / weak / unbreakable references
// ============================================================================

void test_reference_policies() {
    std::cout << "Testing reference policies..." << std::endl;

    pointers_db db;
    create_article_tables(db);

    auto article = insert_article(db, "Target");
    auto like = insert_ref(db, "likes", article);
    auto bookmark = insert_ref(db, "bookmarks", article);
    auto pin = insert_ref(db, "pins", article);

    // Unbreakable: the article cannot go while pinned
    bool caught = false;
    try {
        db.remove("articles", article);
    } catch (const pointers::db_error& e) {
        caught = true;
        assert((e.code() & 0xFF) == SQLITE_CONSTRAINT);
    }
    assert(caught);
    assert(db.find("articles", article).has_value());
    assert(db.pointers().find(article).has_value());
    assert(db.find("likes", like).has_value());

    assert(db.remove("pins", pin) == 1);
    assert(!db.pointers().find(pin).has_value());

    assert(db.remove("articles", article) == 1);
    assert(!db.find("articles", article).has_value());
    assert(!db.pointers().find(article).has_value());

    // Strong: the like went with it, pointer included
    assert(!db.find("likes", like).has_value());
    assert(!db.pointers().find(like).has_value());

    // Weak: the bookmark stays, its reference cleared
    auto kept = db.find("bookmarks", bookmark);
    assert(kept.has_value());
    assert(std::holds_alternative<std::nullptr_t>(kept->at("target")));
    assert(db.pointers().find(bookmark).has_value());

    // References must point at something that exists
    assert(throws<pointers::db_error>([&] {
        insert_ref(db, "likes", ulid::generate());
    }));

    std::cout << "  Reference policies test passed!" << std::endl;
}

// ============================================================================
// Test: cascades through a table that points at itself
// ============================================================================

void test_self_referencing_cascade() {
    std::cout << "Testing self-referencing cascade..." << std::endl;

    pointers_db db;
    db.migrate(direction::up, [](migration& m) {
        m.init_pointers();
        m.create_pointable_table("comments", comments_id, [&](auto& t) {
            t.add("body", column_type::text);
            t.add("parent", m.strong_pointer());
        });
        m.create_pointable_table("likes", likes_id, [&](auto& t) {
            t.add("target", m.strong_pointer(), {.nullable = false});
        });
    });

    auto root = ulid::generate();
    db.insert("comments", {{"id", root.dump()}, {"body", "root"}, {"parent", nullptr}});
    auto reply = ulid::generate();
    db.insert("comments", {{"id", reply.dump()}, {"body", "reply"}, {"parent", root.dump()}});
    auto nested = ulid::generate();
    db.insert("comments", {{"id", nested.dump()}, {"body", "nested"}, {"parent", reply.dump()}});
    auto like = insert_ref(db, "likes", nested);

    assert(db.remove("comments", root) == 1);

    // Every level of replies went, each with its pointer
    assert(!db.find("comments", reply).has_value());
    assert(!db.find("comments", nested).has_value());
    assert(!db.pointers().find(reply).has_value());
    assert(!db.pointers().find(nested).has_value());

    // And so did what pointed at the deepest reply
    assert(!db.find("likes", like).has_value());
    assert(!db.pointers().find(like).has_value());
    assert(db.pointers().count_for(ulid::cast(comments_id)) == 0);
    assert(db.pointers().count_for(ulid::cast(likes_id)) == 0);

    std::cout << "  Self-referencing cascade test passed!" << std::endl;
}

// ============================================================================
// Test: reference column definitions
// ============================================================================

void test_reference_definitions() {
    std::cout << "Testing reference definitions..." << std::endl;

    using pointers::fk_action;
    using pointers::pointer_type;

    assert(pointers::policy_for(pointer_type::strong).on_delete == fk_action::cascade);
    assert(pointers::policy_for(pointer_type::weak).on_delete == fk_action::set_null);
    assert(pointers::policy_for(pointer_type::unbreakable).on_delete == fk_action::restrict);
    for (auto policy : pointers::pointer_policies) {
        assert(policy.on_update == fk_action::cascade);
    }

    assert(pointers::pointer_type_from_string("weak") == pointer_type::weak);
    assert(!pointers::pointer_type_from_string("fragile").has_value());
    assert(std::string(pointers::to_string(pointer_type::unbreakable)) == "unbreakable");

    auto weak = pointers::weak_pointer("pointers_pointer").to_sql();
    assert(weak == "REFERENCES \"pointers_pointer\"(\"id\") ON DELETE SET NULL ON UPDATE CASCADE");

    pointers::table_builder table("tags", "pointers_pointer");
    table.add("owner", pointers::pointer("pointers_pointer", pointer_type::strong), {.primary_key = true});
    table.add("name", column_type::text, {.nullable = false, .primary_key = true});
    table.add("rank", column_type::integer, {.default_sql = "0"});
    assert(table.has_column("owner"));
    assert(!table.has_column("id"));

    auto sql = table.create_sql({.without_rowid = true});
    assert(sql.find("CREATE TABLE IF NOT EXISTS \"tags\"") == 0);
    assert(sql.find("PRIMARY KEY (\"owner\", \"name\")") != std::string::npos);
    assert(sql.find("\"rank\" INTEGER DEFAULT (0)") != std::string::npos);
    assert(sql.find("WITHOUT ROWID") != std::string::npos);

    // The composite-key table works as a side table of the pointer store
    pointers_db db;
    create_article_tables(db);
    db.db().execute(sql);
    auto article = insert_article(db, "Tagged");
    db.db().insert("tags", {{"owner", article.dump()}, {"name", "news"}});
    db.remove("articles", article);
    assert(db.db().query("SELECT * FROM tags").empty());

    std::cout << "  Reference definitions test passed!" << std::endl;
}

// ============================================================================
// Test: mixin tables
// ============================================================================

void test_mixin_table() {
    std::cout << "Testing mixin tables..." << std::endl;

    pointers_db db;
    create_article_tables(db);
    db.migrate(direction::up, [](migration& m) {
        m.create_mixin_table("stats", [](auto& t) {
            t.add("views", column_type::integer, {.nullable = false, .default_sql = "0"});
        });
    });
    assert(!db.triggers().has_trigger("stats"));

    auto article = insert_article(db, "Popular");
    db.db().insert("stats", {{"id", article.dump()}, {"views", int64_t{42}}});
    auto stats = db.find("stats", article);
    assert(stats.has_value());
    assert(std::get<int64_t>(stats->at("views")) == 42);

    // Keyed by existing pointers only
    assert(throws<pointers::db_error>([&] {
        db.db().insert("stats", {{"id", ulid::generate().dump()}});
    }));

    // Goes away with the row it extends
    db.remove("articles", article);
    assert(!db.find("stats", article).has_value());

    db.migrate(direction::up, [](migration& m) {
        m.drop_mixin_table("stats");
    });
    assert(!db.db().table_exists("stats"));

    std::cout << "  Mixin table test passed!" << std::endl;
}

// ============================================================================
// Test: follow and repoint
// ============================================================================

void test_follow_and_repoint() {
    std::cout << "Testing follow and repoint..." << std::endl;

    pointers_db db;
    create_article_tables(db);

    auto article = insert_article(db, "Followed");
    auto like = insert_ref(db, "likes", article);

    auto followed = db.follow(article);
    assert(followed.has_value());
    assert(followed->table == "articles");
    assert(followed->pointer.table_id == ulid::cast(articles_id));
    assert(followed->row.has_value());
    assert(std::get<std::string>(followed->row->at("title")) == "Followed");

    // Through a referencing row
    auto like_row = db.find("likes", like);
    auto target = pointers::detail::ulid_from_column(like_row->at("target"));
    assert(db.follow(target)->table == "articles");

    // Table ids resolve to the registry
    auto table = db.follow(ulid::cast(likes_id));
    assert(table.has_value());
    assert(table->table == "pointers_table");
    assert(std::get<std::string>(table->row->at("table")) == "likes");

    assert(!db.follow(ulid::generate()).has_value());

    // Pointer store maintenance
    assert(!db.pointers().create(article, ulid::cast(articles_id)));
    auto loose = ulid::generate();
    assert(db.pointers().create(loose, ulid::cast(articles_id)));
    auto dangling = db.follow(loose);
    assert(dangling.has_value());
    assert(!dangling->row.has_value());

    assert(db.pointers().repoint(loose, ulid::cast(likes_id)));
    assert(db.pointers().find(loose)->table_id == ulid::cast(likes_id));
    assert(!db.pointers().repoint(ulid::generate(), ulid::cast(likes_id)));
    assert(throws<pointers::db_error>([&] {
        db.pointers().repoint(loose, ulid::generate());
    }));

    std::cout << "  Follow and repoint test passed!" << std::endl;
}

// ============================================================================
// Test: transactions
// ============================================================================

void test_transactions() {
    std::cout << "Testing transactions..." << std::endl;

    pointers_db db;
    create_article_tables(db);

    ulid kept;
    db.write([&] {
        kept = insert_article(db, "Committed");
        // Nested writes join the open transaction
        db.write([&] {
            insert_ref(db, "likes", kept);
        });
    });
    assert(db.find("articles", kept).has_value());
    assert(db.pointers().count_for(ulid::cast(likes_id)) == 1);

    ulid discarded;
    bool caught = false;
    try {
        db.write([&] {
            discarded = insert_article(db, "Rolled back");
            throw std::runtime_error("abort");
        });
    } catch (const std::runtime_error&) {
        caught = true;
    }
    assert(caught);
    assert(!db.db().is_in_transaction());
    assert(!db.find("articles", discarded).has_value());
    assert(!db.pointers().find(discarded).has_value());

    // A failed migration leaves the schema untouched
    assert(throws<std::runtime_error>([&] {
        db.migrate(direction::up, [](migration& m) {
            m.create_pointable_table("comments", comments_id, [](auto& t) {
                t.add("body", column_type::text);
            });
            throw std::runtime_error("abort");
        });
    }));
    assert(!db.db().table_exists("comments"));
    assert(!db.registry().find("comments").has_value());

    // Bad ids are rejected before any DDL runs
    assert(throws<pointers::invalid_identifier>([&] {
        db.migrate(direction::up, [](migration& m) {
            m.create_pointable_table("comments", "not-an-id", [](auto&) {});
        });
    }));
    assert(!db.db().table_exists("comments"));

    std::cout << "  Transactions test passed!" << std::endl;
}

// ============================================================================
// Test: failed migrations leave the connection writable
// ============================================================================

void test_failed_migration_keeps_function() {
    std::cout << "Testing trigger function after failed migrations..." << std::endl;

    pointers_db db;
    db.migrate(direction::up, [](migration& m) {
        m.init_pointers();
        m.create_pointable_table("articles", articles_id, [](auto& t) {
            t.add("title", column_type::text, {.nullable = false});
        });
    });

    // Teardown rolled back: schema and function both come back
    assert(throws<std::runtime_error>([&] {
        db.migrate(direction::down, [](migration& m) {
            m.init_pointers();
            throw std::runtime_error("abort");
        });
    }));
    assert(db.is_initialized());
    assert(db.triggers().has_trigger("articles"));
    assert(db.triggers().function_installed());

    auto row = insert_article(db, "Still writable");
    assert(db.pointers().find(row)->table_id == ulid::cast(articles_id));

    assert(throws<std::runtime_error>([&] {
        db.migrate(direction::up, [](migration& m) {
            m.drop_pointer_trigger_function();
            throw std::runtime_error("abort");
        });
    }));
    assert(db.triggers().function_installed());
    auto second = insert_article(db, "Again");
    assert(db.pointers().find(second).has_value());

    // Set-up rolled back: no function is left behind
    pointers_db fresh;
    assert(throws<std::runtime_error>([&] {
        fresh.migrate(direction::up, [](migration& m) {
            m.init_pointers();
            throw std::runtime_error("abort");
        });
    }));
    assert(!fresh.is_initialized());
    assert(!fresh.triggers().function_installed());

    std::cout << "  Failed migration test passed!" << std::endl;
}

// ============================================================================
// Test: identifier SQL functions
// ============================================================================

void test_ulid_sql_functions() {
    std::cout << "Testing ulid SQL functions..." << std::endl;

    pointers_db db;
    db.migrate(direction::up, [](migration& m) {
        m.init_pointers();
        m.init_pointers_ulid_extra();
    });

    auto rows = db.db().query("SELECT length(ulid()) AS n");
    assert(std::get<int64_t>(rows[0].at("n")) == 16);

    rows = db.db().query("SELECT ulid_text(ulid_blob(?)) AS t", {std::string("01arz3ndektsv4rrffq69g5fav")});
    assert(std::get<std::string>(rows[0].at("t")) == "01ARZ3NDEKTSV4RRFFQ69G5FAV");

    rows = db.db().query("SELECT ulid_text(id) AS t FROM pointers_table");
    assert(std::get<std::string>(rows[0].at("t")) == pointers::registry_table_id);

    rows = db.db().query("SELECT ulid_text(NULL) AS t");
    assert(std::holds_alternative<std::nullptr_t>(rows[0].at("t")));

    assert(throws<pointers::db_error>([&] {
        db.db().query("SELECT ulid_blob('not-an-id')");
    }));

    // Default ids straight from SQL
    db.migrate(direction::up, [](migration& m) {
        m.create_pointable_table("comments", comments_id, [](auto& t) {
            t.add("body", column_type::text);
        });
    });
    db.db().execute("INSERT INTO comments (id, body) VALUES (ulid(), 'from sql')");
    assert(db.pointers().count_for(ulid::cast(comments_id)) == 1);

    std::cout << "  ulid SQL functions test passed!" << std::endl;
}

// ============================================================================
// Test: custom names
// ============================================================================

void test_custom_configuration() {
    std::cout << "Testing custom configuration..." << std::endl;

    pointers::configuration config;
    config.table_source = "tables";
    config.pointer_source = "refs";
    // Keywords are fine, every name is quoted
    config.trigger_function = "select";
    config.trigger_prefix = "tag_";
    config.delete_trigger_prefix = "untag_";
    config.level = pointers::log_level::warn;

    {
        pointers_db db(config);
        assert(pointers::get_log_level() == pointers::log_level::warn);

        db.migrate(direction::up, [](migration& m) {
            m.init_pointers();
            m.create_pointable_table("articles", articles_id, [](auto& t) {
                t.add("title", column_type::text);
            });
        });
        assert(db.db().table_exists("tables"));
        assert(db.db().table_exists("refs"));
        assert(!db.db().table_exists("pointers_pointer"));
        assert(db.db().trigger_exists("tag_articles"));
        assert(db.db().trigger_exists("untag_articles"));
        assert(db.db().index_exists("tables_table_index"));
        assert(db.triggers().function_installed());

        auto row = insert_article(db, "Custom");
        auto found = db.db().query("SELECT table_id FROM refs WHERE id = ?", {row.dump()});
        assert(found.size() == 1);
        assert(pointers::detail::ulid_from_column(found[0].at("table_id")) == ulid::cast(articles_id));
    }
    pointers::set_log_level(pointers::log_level::off);

    config.trigger_prefix = config.delete_trigger_prefix;
    assert(throws<pointers::config_error>([&] { pointers_db db(config); }));

    std::cout << "  Custom configuration test passed!" << std::endl;
}

// ============================================================================
// Test: file database reopened on a new connection
// ============================================================================

void test_file_database() {
    std::cout << "Testing file database..." << std::endl;

    auto path = (std::filesystem::temp_directory_path() / "pointers_core_test.sqlite").string();
    auto cleanup = [&] {
        for (const char* suffix : {"", "-wal", "-shm"}) {
            std::filesystem::remove(path + suffix);
        }
    };
    cleanup();

    ulid first;
    {
        pointers_db db(path);
        create_article_tables(db);
        first = insert_article(db, "Persisted");
    }

    {
        // Triggers live in the file, the function is reinstalled on open
        pointers_db db(path);
        assert(db.is_initialized());
        assert(db.triggers().function_installed());
        assert(db.pointers().find(first).has_value());

        auto second = insert_article(db, "Second session");
        assert(db.pointers().find(second)->table_id == ulid::cast(articles_id));
        assert(db.pointers().count_for(ulid::cast(articles_id)) == 2);

        // A second, read-only connection next to the writer
        pointers::configuration config(path);
        config.read_only = true;
        pointers_db reader(config);
        assert(reader.find("articles", second).has_value());
        assert(throws<pointers::db_error>([&] {
            reader.migrate(direction::up, [](migration& m) { m.init_pointers(); });
        }));
    }

    cleanup();
    std::cout << "  File database test passed!" << std::endl;
}

// ============================================================================
// Main
// ============================================================================

int main() {
    std::cout << "=== PointersCore Tests ===" << std::endl;
    std::cout << std::endl;

    try {
        ulid_tests::run_all();
        config_tests::run_all();

        // Schema
        test_init_pointers();
        test_init_pointers_down();
        test_registry_stability();
        test_typed_schema();

        // Trigger protocol
        test_insert_creates_pointer();
        test_unregistered_table_rejected();
        test_trigger_idempotent();
        test_drop_function_drops_triggers();

        // References
        test_reference_policies();
        test_self_referencing_cascade();
        test_reference_definitions();
        test_mixin_table();
        test_follow_and_repoint();

        // Write path
        test_transactions();
        test_failed_migration_keeps_function();
        test_ulid_sql_functions();
        test_custom_configuration();
        test_file_database();

        std::cout << std::endl;
        std::cout << "=== All tests passed! ===" << std::endl;
        return 0;
    } catch (const std::exception& e) {
        std::cerr << "Test failed with exception: " << e.what() << std::endl;
        return 1;
    }
}
