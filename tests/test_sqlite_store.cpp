#include <catch2/catch_test_macros.hpp>
#include "memory/database.hpp"
#include "memory/sqlite_store.hpp"
#include "util.hpp"
#include <filesystem>
#include <sqlite3.h>
#include <unistd.h>

using namespace engram;

static std::string store_test_path() {
    return "/tmp/engram_test_store_" + std::to_string(getpid()) + ".db";
}

struct StoreFixture {
    std::string path = store_test_path();
    Database db{path};
    SqliteStore store{db};

    ~StoreFixture() {
        std::filesystem::remove(path);
        std::filesystem::remove(path + "-wal");
        std::filesystem::remove(path + "-shm");
    }

    Memory add(const std::string& title, const std::string& content,
               MemoryType type = MemoryType::Observation, double importance = 0.5) {
        MemoryInput in;
        in.type = type;
        in.title = title;
        in.content = content;
        in.importance = importance;
        return store.insert(in);
    }

    void set_created(int64_t id, uint64_t created_at) {
        std::string sql = "UPDATE memories SET created_at = " + std::to_string(created_at) +
                          " WHERE id = " + std::to_string(id) + ";";
        REQUIRE(sqlite3_exec(db.handle(), sql.c_str(), nullptr, nullptr, nullptr) == SQLITE_OK);
    }
};

// ── build_fts_query ──────────────────────────────────────────────

TEST_CASE("build_fts_query: quoted prefix terms joined with OR", "[sqlite_store]") {
    REQUIRE(build_fts_query("auth token") == "\"auth\"* OR \"token\"*");
    REQUIRE(build_fts_query("fix: \"login\" (bug)") == "\"fix\"* OR \"login\"* OR \"bug\"*");
    REQUIRE(build_fts_query("a ! ?").empty());
    REQUIRE(build_fts_query("").empty());
}

// ── Insert and point lookups ─────────────────────────────────────

TEST_CASE("SqliteStore: insert assigns id and timestamps", "[sqlite_store]") {
    StoreFixture f;
    MemoryInput in;
    in.type = MemoryType::Decision;
    in.title = "Use SQLite";
    in.content = "Chosen for FTS5";
    in.facts = {"single file"};
    in.concepts = {"storage"};
    in.source_files = {"/src/db.cpp"};
    in.importance = 8;
    in.phase = "plan";
    in.session_id = "s1";

    auto m = f.store.insert(in);
    REQUIRE(m.id > 0);
    REQUIRE(m.importance == 0.8);
    REQUIRE(m.created_at > 0);
    REQUIRE(m.created_at == m.updated_at);
    REQUIRE(m.created_at == m.accessed_at);
    REQUIRE(m.access_count == 0);

    auto back = f.store.fetch(m.id);
    REQUIRE(back.has_value());
    REQUIRE(back->type == MemoryType::Decision);
    REQUIRE(back->title == "Use SQLite");
    REQUIRE(back->facts == std::vector<std::string>{"single file"});
    REQUIRE(back->concepts == std::vector<std::string>{"storage"});
    REQUIRE(back->source_files == std::vector<std::string>{"/src/db.cpp"});
    REQUIRE(back->phase == std::optional<std::string>("plan"));
    REQUIRE(back->session_id == std::optional<std::string>("s1"));
    REQUIRE(back->importance == 0.8);
}

TEST_CASE("SqliteStore: get_by_id counts an access, fetch does not", "[sqlite_store]") {
    StoreFixture f;
    auto m = f.add("Title", "Body");

    REQUIRE(f.store.fetch(m.id)->access_count == 0);
    auto got = f.store.get_by_id(m.id);
    REQUIRE(got.has_value());
    REQUIRE(got->access_count == 1);
    REQUIRE(f.store.fetch(m.id)->access_count == 1);

    f.store.touch({m.id});
    REQUIRE(f.store.fetch(m.id)->access_count == 2);
}

TEST_CASE("SqliteStore: missing ids", "[sqlite_store]") {
    StoreFixture f;
    REQUIRE_FALSE(f.store.get_by_id(999).has_value());
    REQUIRE_FALSE(f.store.fetch(999).has_value());
    REQUIRE_FALSE(f.store.update(999, MemoryUpdate{}).has_value());
    REQUIRE_FALSE(f.store.remove(999));
}

TEST_CASE("SqliteStore: insert_batch inserts all", "[sqlite_store]") {
    StoreFixture f;
    std::vector<MemoryInput> inputs(3);
    for (size_t i = 0; i < inputs.size(); ++i) {
        inputs[i].title = "batch " + std::to_string(i);
        inputs[i].content = "content";
    }
    auto saved = f.store.insert_batch(inputs);
    REQUIRE(saved.size() == 3);
    REQUIRE(saved[0].id < saved[1].id);
    REQUIRE(f.store.count() == 3);
}

// ── Update and remove ────────────────────────────────────────────

TEST_CASE("SqliteStore: update changes fields and re-indexes", "[sqlite_store]") {
    StoreFixture f;
    auto m = f.add("Original heading", "alpha text");

    MemoryUpdate u;
    u.title = "Zebra heading";
    u.importance = 0.9;
    u.visibility = Visibility::Private;
    auto updated = f.store.update(m.id, u);
    REQUIRE(updated.has_value());
    REQUIRE(updated->title == "Zebra heading");
    REQUIRE(updated->content == "alpha text");
    REQUIRE(updated->importance == 0.9);
    REQUIRE(updated->id == m.id);

    SearchFilters all;
    all.include_private = true;
    auto hits = f.store.search_fts("zebra", 10, all);
    REQUIRE(hits.size() == 1);
    REQUIRE(hits[0].memory.id == m.id);
    REQUIRE(f.store.search_fts("original", 10, all).empty());
}

TEST_CASE("SqliteStore: remove deletes row and index entry", "[sqlite_store]") {
    StoreFixture f;
    auto m = f.add("Kangaroo facts", "hops");
    REQUIRE(f.store.remove(m.id));
    REQUIRE_FALSE(f.store.fetch(m.id).has_value());
    REQUIRE(f.store.search_fts("kangaroo", 10, SearchFilters{}).empty());
    REQUIRE_FALSE(f.store.remove(m.id));
}

// ── Keyword search ───────────────────────────────────────────────

TEST_CASE("SqliteStore: search_fts ranks title matches first", "[sqlite_store]") {
    StoreFixture f;
    auto body = f.add("Unrelated heading", "we discussed caching strategies today");
    auto title = f.add("Caching layer design", "notes");

    auto hits = f.store.search_fts("caching", 10, SearchFilters{});
    REQUIRE(hits.size() == 2);
    REQUIRE(hits[0].memory.id == title.id);
    REQUIRE(hits[1].memory.id == body.id);
    REQUIRE(hits[0].score >= hits[1].score);
    REQUIRE(hits[0].match_type == MatchType::Fts);
}

TEST_CASE("SqliteStore: search_fts uses stemming and prefixes", "[sqlite_store]") {
    StoreFixture f;
    auto m = f.add("Deploying the service", "rollout notes");
    REQUIRE(f.store.search_fts("deploy", 10, SearchFilters{}).size() == 1);
    REQUIRE(f.store.search_fts("serv", 10, SearchFilters{}).size() == 1);
    REQUIRE(f.store.search_fts("deploy", 10, SearchFilters{})[0].memory.id == m.id);
}

TEST_CASE("SqliteStore: search_fts applies filters", "[sqlite_store]") {
    StoreFixture f;
    auto decision = f.add("Parser choice", "parser detail", MemoryType::Decision, 0.9);
    f.add("Parser note", "parser detail", MemoryType::Note, 0.2);

    MemoryInput priv;
    priv.title = "Parser secret plan";
    priv.content = "parser detail";
    priv.visibility = Visibility::Private;
    auto hidden = f.store.insert(priv);

    SearchFilters by_type;
    by_type.types = {MemoryType::Decision};
    auto typed = f.store.search_fts("parser", 10, by_type);
    REQUIRE(typed.size() == 1);
    REQUIRE(typed[0].memory.id == decision.id);

    SearchFilters by_importance;
    by_importance.min_importance = 5;   // 0.5 canonical
    auto important = f.store.search_fts("parser", 10, by_importance);
    REQUIRE(important.size() == 1);
    REQUIRE(important[0].memory.id == decision.id);

    REQUIRE(f.store.search_fts("parser", 10, SearchFilters{}).size() == 2);

    SearchFilters with_private;
    with_private.include_private = true;
    auto everything = f.store.search_fts("parser", 10, with_private);
    REQUIRE(everything.size() == 3);
    bool saw_hidden = false;
    for (const auto& r : everything) saw_hidden = saw_hidden || r.memory.id == hidden.id;
    REQUIRE(saw_hidden);
}

TEST_CASE("SqliteStore: search_fts phase filter", "[sqlite_store]") {
    StoreFixture f;
    MemoryInput a;
    a.title = "Schema migration";
    a.content = "x";
    a.phase = "build";
    auto in_build = f.store.insert(a);
    a.phase = "plan";
    f.store.insert(a);

    SearchFilters filters;
    filters.phase = "build";
    auto hits = f.store.search_fts("migration", 10, filters);
    REQUIRE(hits.size() == 1);
    REQUIRE(hits[0].memory.id == in_build.id);
}

TEST_CASE("SqliteStore: substring fallback when FTS finds nothing", "[sqlite_store]") {
    StoreFixture f;
    auto m = f.add("Contact", "reach me at ##ops## channel");
    auto hits = f.store.search_fts("##", 10, SearchFilters{});
    REQUIRE(hits.size() == 1);
    REQUIRE(hits[0].memory.id == m.id);
}

TEST_CASE("SqliteStore: substring fallback treats wildcards literally", "[sqlite_store]") {
    StoreFixture f;
    f.add("Plain", "nothing special");
    auto pct = f.add("Coverage", "branch coverage at 85% now");
    f.add("Names", "snake case only");
    auto under = f.add("Identifiers", "uses max_batch setting");

    auto by_pct = f.store.search_fts("%", 10, SearchFilters{});
    REQUIRE(by_pct.size() == 1);
    REQUIRE(by_pct[0].memory.id == pct.id);

    auto by_under = f.store.search_fts("_", 10, SearchFilters{});
    REQUIRE(by_under.size() == 1);
    REQUIRE(by_under[0].memory.id == under.id);
}

TEST_CASE("SqliteStore: search_fts highlights the content snippet", "[sqlite_store]") {
    StoreFixture f;
    f.add("Heading", "the quick brown fox");
    auto hits = f.store.search_fts("brown", 10, SearchFilters{});
    REQUIRE(hits.size() == 1);
    REQUIRE(hits[0].highlighted.find("**brown**") != std::string::npos);
}

TEST_CASE("SqliteStore: blank query returns nothing", "[sqlite_store]") {
    StoreFixture f;
    f.add("Anything", "at all");
    REQUIRE(f.store.search_fts("   ", 10, SearchFilters{}).empty());
    REQUIRE(f.store.search_fts("anything", 0, SearchFilters{}).empty());
}

// ── Listing ──────────────────────────────────────────────────────

TEST_CASE("SqliteStore: get_recent is newest first with id tie-break", "[sqlite_store]") {
    StoreFixture f;
    f.add("A", "a");
    auto b = f.add("B", "b");
    auto c = f.add("C", "c");

    auto recent = f.store.get_recent(2, {});
    REQUIRE(recent.size() == 2);
    REQUIRE(recent[0].id == c.id);
    REQUIRE(recent[1].id == b.id);
}

TEST_CASE("SqliteStore: get_recent orders by created_at before id", "[sqlite_store]") {
    StoreFixture f;
    auto a = f.add("A", "a");
    auto b = f.add("B", "b");
    f.set_created(b.id, 1000);

    auto recent = f.store.get_recent(10, {});
    REQUIRE(recent.size() == 2);
    REQUIRE(recent[0].id == a.id);
    REQUIRE(recent[1].id == b.id);
}

TEST_CASE("SqliteStore: get_recent filters types and hides private", "[sqlite_store]") {
    StoreFixture f;
    auto d = f.add("Decided", "x", MemoryType::Decision);
    f.add("Observed", "y", MemoryType::Observation);
    MemoryInput priv;
    priv.type = MemoryType::Decision;
    priv.title = "Private decision";
    priv.content = "z";
    priv.visibility = Visibility::Private;
    f.store.insert(priv);

    auto decisions = f.store.get_recent(10, {MemoryType::Decision});
    REQUIRE(decisions.size() == 1);
    REQUIRE(decisions[0].id == d.id);

    REQUIRE(f.store.get_recent(10, {MemoryType::Decision}, true).size() == 2);
    REQUIRE(f.store.get_recent(0, {}).empty());
}

TEST_CASE("SqliteStore: get_by_concepts exact membership", "[sqlite_store]") {
    StoreFixture f;
    MemoryInput in;
    in.title = "FTS tuning";
    in.content = "bm25 weights";
    in.concepts = {"sqlite", "fts"};
    in.importance = 0.4;
    auto low = f.store.insert(in);
    in.title = "FTS schema";
    in.concepts = {"fts"};
    in.importance = 0.9;
    auto high = f.store.insert(in);

    auto hits = f.store.get_by_concepts({"fts"}, 10);
    REQUIRE(hits.size() == 2);
    REQUIRE(hits[0].id == high.id);
    REQUIRE(hits[1].id == low.id);

    REQUIRE(f.store.get_by_concepts({"ft"}, 10).empty());
    REQUIRE(f.store.get_by_concepts({"sqlite"}, 10).size() == 1);
    REQUIRE(f.store.get_by_concepts({}, 10).empty());
}

TEST_CASE("SqliteStore: get_by_phase and get_by_session", "[sqlite_store]") {
    StoreFixture f;
    MemoryInput in;
    in.title = "first";
    in.content = "x";
    in.phase = "review";
    in.session_id = "sess";
    auto first = f.store.insert(in);
    in.title = "second";
    in.phase = std::nullopt;
    auto second = f.store.insert(in);

    auto phase = f.store.get_by_phase("review", 10);
    REQUIRE(phase.size() == 1);
    REQUIRE(phase[0].id == first.id);

    auto session = f.store.get_by_session("sess");
    REQUIRE(session.size() == 2);
    REQUIRE(session[0].id == first.id);
    REQUIRE(session[1].id == second.id);
    REQUIRE(f.store.get_by_session("other").empty());
}

// ── Counting and stats ───────────────────────────────────────────

TEST_CASE("SqliteStore: count and stats", "[sqlite_store]") {
    StoreFixture f;
    auto a = f.add("a", "a", MemoryType::Decision);
    f.add("b", "b", MemoryType::Decision);
    auto c = f.add("c", "c", MemoryType::Note);
    f.set_created(a.id, 500);

    MemoryUpdate hide;
    hide.visibility = Visibility::Private;
    f.store.update(c.id, hide);

    REQUIRE(f.store.count() == 3);
    REQUIRE(f.store.count({MemoryType::Decision}) == 2);
    REQUIRE(f.store.count({MemoryType::Todo}) == 0);

    auto s = f.store.stats();
    REQUIRE(s.total == 3);
    REQUIRE(s.by_type.at("decision") == 2);
    REQUIRE(s.by_type.at("note") == 1);
    REQUIRE(s.public_count == 2);
    REQUIRE(s.private_count == 1);
    REQUIRE(s.oldest == 500);
    REQUIRE(s.newest >= s.oldest);
}

TEST_CASE("SqliteStore: stats on empty store", "[sqlite_store]") {
    StoreFixture f;
    auto s = f.store.stats();
    REQUIRE(s.total == 0);
    REQUIRE(s.by_type.empty());
}

// ── Sweeps ───────────────────────────────────────────────────────

TEST_CASE("SqliteStore: delete_created_before sweeps in batches", "[sqlite_store]") {
    StoreFixture f;
    std::vector<int64_t> old_ids;
    for (int i = 0; i < 7; ++i) {
        auto m = f.add("old " + std::to_string(i), "x");
        f.set_created(m.id, 100);
        old_ids.push_back(m.id);
    }
    auto keep = f.add("keep", "x");

    REQUIRE(f.store.delete_created_before(1000, 3) == 7);
    REQUIRE(f.store.count() == 1);
    REQUIRE(f.store.fetch(keep.id).has_value());
}

TEST_CASE("SqliteStore: trim_to_max deletes lowest importance then oldest", "[sqlite_store]") {
    StoreFixture f;
    auto a = f.add("a", "x", MemoryType::Observation, 0.2);
    auto b = f.add("b", "x", MemoryType::Observation, 0.2);
    auto c = f.add("c", "x", MemoryType::Observation, 0.9);
    auto d = f.add("d", "x", MemoryType::Observation, 0.5);
    f.set_created(b.id, 100);   // b is older than a at equal importance

    REQUIRE(f.store.trim_to_max(3, 500) == 1);
    REQUIRE_FALSE(f.store.fetch(b.id).has_value());
    REQUIRE(f.store.fetch(a.id).has_value());

    REQUIRE(f.store.trim_to_max(1, 1) == 2);
    REQUIRE(f.store.count() == 1);
    REQUIRE(f.store.fetch(c.id).has_value());
    REQUIRE_FALSE(f.store.fetch(d.id).has_value());
}

TEST_CASE("SqliteStore: reopening keeps data", "[sqlite_store]") {
    std::string path = "/tmp/engram_test_reopen_" + std::to_string(getpid()) + ".db";
    int64_t id = 0;
    {
        Database db(path);
        SqliteStore store(db);
        MemoryInput in;
        in.title = "persisted";
        in.content = "survives restart";
        id = store.insert(in).id;
    }
    {
        Database db(path);
        SqliteStore store(db);
        auto m = store.fetch(id);
        REQUIRE(m.has_value());
        REQUIRE(m->title == "persisted");
        REQUIRE(store.search_fts("survives", 10, SearchFilters{}).size() == 1);
    }
    std::filesystem::remove(path);
    std::filesystem::remove(path + "-wal");
    std::filesystem::remove(path + "-shm");
}
