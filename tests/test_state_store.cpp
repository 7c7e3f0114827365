#include <catch2/catch.hpp>
#include <strata/state_store.hpp>
#include <sqlite3.h>
#include <filesystem>
#include <fstream>
#include <unistd.h>

namespace fs = std::filesystem;
using namespace strata;

static std::string test_db_path() {
    static int counter = 0;
    return "/tmp/strata_test_state_store_" + std::to_string(getpid())
           + "_" + std::to_string(counter++) + ".db";
}

static void remove_db(const std::string& path) {
    fs::remove(path);
    fs::remove(path + "-wal");
    fs::remove(path + "-shm");
}

static StepState sample_state(const std::string& part, Step step) {
    StepState st;
    st.part = part;
    st.step = step;
    st.properties = {
        {"plugin", std::string("make")},
        {"jobs", int64_t(-3)},
        {"debug", true},
        {"stage", std::vector<std::string>{"usr", "-usr/include"}},
    };
    st.options = {{"strata.target-arch", "amd64"}};
    st.source_identity = "local:abc";
    st.upstream = {{"base:stage", "ff00"}};
    FingerprintInputs in{step, st.properties, st.options, st.source_identity, st.upstream};
    st.fingerprint = StateStore::fingerprint_inputs(in);
    st.files = {"usr/bin/tool"};
    st.directories = {"usr", "usr/bin"};
    st.details = {{"commit", "deadbeef"}};
    return st;
}

// ---------------------------------------------------------------------------
// Database lifecycle
// ---------------------------------------------------------------------------

TEST_CASE("StateStore open creates database file", "[state_store]") {
    auto path = test_db_path();
    StateStore store;
    REQUIRE_FALSE(store.is_open());
    REQUIRE(store.open(path).is_ok());
    REQUIRE(store.is_open());
    REQUIRE(fs::exists(path));
    store.close();
    REQUIRE_FALSE(store.is_open());
    remove_db(path);
}

TEST_CASE("StateStore operations fail when closed", "[state_store]") {
    StateStore store;
    auto r = store.get("a", Step::Pull);
    REQUIRE(r.is_err());
    REQUIRE(r.error().code == StrataError::IO);
}

TEST_CASE("StateStore recreates a garbage database", "[state_store]") {
    auto path = test_db_path();
    {
        std::ofstream f(path);
        f << "this is not a sqlite database, not even close, just text padding "
             "to get past the header size check ............................";
    }
    StateStore store;
    REQUIRE(store.open(path).is_ok());
    REQUIRE(store.put(sample_state("a", Step::Pull)).is_ok());
    store.close();
    remove_db(path);
}

// ---------------------------------------------------------------------------
// Step state
// ---------------------------------------------------------------------------

TEST_CASE("StateStore get returns absent for unknown keys", "[state_store]") {
    auto path = test_db_path();
    StateStore store;
    REQUIRE(store.open(path).is_ok());
    auto r = store.get("nothing", Step::Build);
    REQUIRE(r.is_ok());
    REQUIRE_FALSE(r.value().has_value());
    store.close();
    remove_db(path);
}

TEST_CASE("StateStore stores and reloads step state", "[state_store]") {
    auto path = test_db_path();
    auto st = sample_state("app", Step::Build);
    {
        StateStore store;
        REQUIRE(store.open(path).is_ok());
        REQUIRE(store.put(st).is_ok());
    }

    StateStore store;
    REQUIRE(store.open(path).is_ok());
    auto r = store.get("app", Step::Build);
    REQUIRE(r.is_ok());
    REQUIRE(r.value().has_value());
    const auto& got = *r.value();
    REQUIRE(got.fingerprint == st.fingerprint);
    REQUIRE(got.fingerprint.inputs_hash == st.fingerprint.inputs_hash);
    REQUIRE(got.properties == st.properties);
    REQUIRE(got.options == st.options);
    REQUIRE(got.source_identity == "local:abc");
    REQUIRE(got.upstream == st.upstream);
    REQUIRE(got.files == st.files);
    REQUIRE(got.directories == st.directories);
    REQUIRE(got.details.at("commit") == "deadbeef");
    REQUIRE(got.serial > 0);
    REQUIRE(got.created_at > 0);
    store.close();
    remove_db(path);
}

TEST_CASE("StateStore put overwrites and bumps the serial", "[state_store]") {
    auto path = test_db_path();
    StateStore store;
    REQUIRE(store.open(path).is_ok());
    REQUIRE(store.put(sample_state("a", Step::Pull)).is_ok());
    REQUIRE(store.put(sample_state("b", Step::Pull)).is_ok());
    auto first = store.get("a", Step::Pull).value()->serial;

    auto changed = sample_state("a", Step::Pull);
    changed.source_identity = "local:def";
    REQUIRE(store.put(changed).is_ok());
    auto again = store.get("a", Step::Pull).value();
    REQUIRE(again->source_identity == "local:def");
    REQUIRE(again->serial > first);

    auto keys = store.keys().value();
    REQUIRE(keys.size() == 2);
    REQUIRE(keys[0] == StepKey{"b", Step::Pull});
    REQUIRE(keys[1] == StepKey{"a", Step::Pull});
    store.close();
    remove_db(path);
}

TEST_CASE("StateStore invalidate and clear", "[state_store]") {
    auto path = test_db_path();
    StateStore store;
    REQUIRE(store.open(path).is_ok());
    REQUIRE(store.put(sample_state("a", Step::Pull)).is_ok());
    REQUIRE(store.put(sample_state("a", Step::Build)).is_ok());

    REQUIRE(store.invalidate("a", Step::Pull).is_ok());
    REQUIRE_FALSE(store.get("a", Step::Pull).value().has_value());
    REQUIRE(store.get("a", Step::Build).value().has_value());
    REQUIRE(store.invalidate("a", Step::Pull).is_ok());

    REQUIRE(store.clear().is_ok());
    REQUIRE(store.keys().value().empty());
    store.close();
    remove_db(path);
}

TEST_CASE("StateStore treats unknown record formats as absent", "[state_store]") {
    auto path = test_db_path();
    StateStore store;
    REQUIRE(store.open(path).is_ok());
    REQUIRE(store.put(sample_state("a", Step::Stage)).is_ok());
    store.close();

    sqlite3* db = nullptr;
    REQUIRE(sqlite3_open(path.c_str(), &db) == SQLITE_OK);
    REQUIRE(sqlite3_exec(db, "UPDATE step_state SET format = 99", nullptr, nullptr, nullptr)
            == SQLITE_OK);
    sqlite3_close(db);

    REQUIRE(store.open(path).is_ok());
    auto r = store.get("a", Step::Stage);
    REQUIRE(r.is_ok());
    REQUIRE_FALSE(r.value().has_value());
    store.close();
    remove_db(path);
}

TEST_CASE("StateStore treats truncated blobs as absent", "[state_store]") {
    auto path = test_db_path();
    StateStore store;
    REQUIRE(store.open(path).is_ok());
    REQUIRE(store.put(sample_state("a", Step::Stage)).is_ok());
    store.close();

    sqlite3* db = nullptr;
    REQUIRE(sqlite3_open(path.c_str(), &db) == SQLITE_OK);
    REQUIRE(sqlite3_exec(db, "UPDATE step_state SET files = X'53535401FF'",
                         nullptr, nullptr, nullptr) == SQLITE_OK);
    sqlite3_close(db);

    REQUIRE(store.open(path).is_ok());
    REQUIRE_FALSE(store.get("a", Step::Stage).value().has_value());
    store.close();
    remove_db(path);
}

TEST_CASE("StateStore discards records on schema version mismatch", "[state_store]") {
    auto path = test_db_path();
    StateStore store;
    REQUIRE(store.open(path).is_ok());
    REQUIRE(store.put(sample_state("a", Step::Pull)).is_ok());
    store.close();

    sqlite3* db = nullptr;
    REQUIRE(sqlite3_open(path.c_str(), &db) == SQLITE_OK);
    REQUIRE(sqlite3_exec(db, "UPDATE schema_info SET value = '0' WHERE key = 'version'",
                         nullptr, nullptr, nullptr) == SQLITE_OK);
    sqlite3_close(db);

    REQUIRE(store.open(path).is_ok());
    REQUIRE(store.keys().value().empty());
    store.close();
    remove_db(path);
}

// ---------------------------------------------------------------------------
// Fingerprints
// ---------------------------------------------------------------------------

TEST_CASE("fingerprint is deterministic and input sensitive", "[state_store]") {
    FingerprintInputs in;
    in.step = Step::Build;
    in.properties = {{"make-parameters", std::vector<std::string>{"V=1"}}};
    in.options = {{"strata.target-arch", "amd64"}};
    in.upstream = {{"a:pull", "01"}};

    auto base = StateStore::fingerprint_inputs(in);
    REQUIRE(StateStore::fingerprint_inputs(in) == base);

    auto other_step = in;
    other_step.step = Step::Stage;
    REQUIRE(StateStore::fingerprint_inputs(other_step) != base);

    auto other_prop = in;
    other_prop.properties["make-parameters"] = std::vector<std::string>{"V=0"};
    auto fp = StateStore::fingerprint_inputs(other_prop);
    REQUIRE(fp != base);
    REQUIRE(fp.deps_hash == base.deps_hash);

    auto other_dep = in;
    other_dep.upstream["a:pull"] = "02";
    auto dep = StateStore::fingerprint_inputs(other_dep);
    REQUIRE(dep != base);
    REQUIRE(dep.inputs_hash == base.inputs_hash);

    auto other_source = in;
    other_source.source_identity = "git:x@HEAD";
    REQUIRE(StateStore::fingerprint_inputs(other_source) != base);
}

// ---------------------------------------------------------------------------
// Ownership
// ---------------------------------------------------------------------------

static OwnershipRecord record(const std::string& path, const std::string& part,
                              const std::string& digest = "d") {
    OwnershipRecord r;
    r.area = Area::Stage;
    r.path = path;
    r.part = part;
    r.step = Step::Stage;
    r.kind = EntryKind::File;
    r.digest = digest;
    return r;
}

TEST_CASE("StateStore ownership claims stack", "[state_store]") {
    auto path = test_db_path();
    StateStore store;
    REQUIRE(store.open(path).is_ok());

    REQUIRE_FALSE(store.owner_of(Area::Stage, "usr/bin/x").value().has_value());
    REQUIRE(store.claim({record("usr/bin/x", "a", "1"), record("usr/lib/y", "a")}).is_ok());
    REQUIRE(store.claim({record("usr/bin/x", "b", "2")}).is_ok());

    auto owner = store.owner_of(Area::Stage, "usr/bin/x").value();
    REQUIRE(owner->part == "b");
    REQUIRE(owner->digest == "2");

    auto hist = store.history(Area::Stage, "usr/bin/x").value();
    REQUIRE(hist.size() == 2);
    REQUIRE(hist[0].part == "b");
    REQUIRE(hist[1].part == "a");
    REQUIRE(hist[0].seq > hist[1].seq);

    auto owned = store.owned_by(Area::Stage, "a").value();
    REQUIRE(owned.size() == 2);
    REQUIRE(owned[0].path == "usr/bin/x");

    REQUIRE(store.owner_of(Area::Prime, "usr/bin/x").value() == std::nullopt);

    REQUIRE(store.release(Area::Stage, "b", {"usr/bin/x"}).is_ok());
    REQUIRE(store.owner_of(Area::Stage, "usr/bin/x").value()->part == "a");
    store.close();
    remove_db(path);
}

TEST_CASE("StepKey formatting and ordering", "[state_store]") {
    StepKey a{"lib", Step::Build};
    REQUIRE(a.str() == "lib:build");
    REQUIRE(StepKey{"lib", Step::Pull} < a);
    REQUIRE(a < StepKey{"z", Step::Pull});
    REQUIRE(std::string(area_name(Area::Prime)) == "prime");
}
