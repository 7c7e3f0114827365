#include <strata/state_store.hpp>
#include <strata/hash.hpp>
#include <strata/log.hpp>
#include <sqlite3.h>

#include <chrono>
#include <cstring>
#include <filesystem>

namespace fs = std::filesystem;

namespace strata {

std::string StepKey::str() const {
    return part + ":" + step_name(step);
}

const char* area_name(Area area) {
    return area == Area::Stage ? "stage" : "prime";
}

// ---------------------------------------------------------------------------
// Blob encoding (varint + length-prefixed strings)
// ---------------------------------------------------------------------------

static const char MAGIC[] = "SST\x01";
static constexpr size_t MAGIC_LEN = 4;
static constexpr int RECORD_FORMAT = 1;

namespace ser {

using Buffer = std::vector<uint8_t>;

static void write_varint(Buffer& buf, uint64_t val) {
    while (val >= 0x80) {
        buf.push_back(static_cast<uint8_t>(val & 0x7F) | 0x80);
        val >>= 7;
    }
    buf.push_back(static_cast<uint8_t>(val));
}

static bool read_varint(const uint8_t*& p, const uint8_t* end, uint64_t& val) {
    val = 0;
    unsigned shift = 0;
    while (p < end) {
        uint8_t b = *p++;
        val |= static_cast<uint64_t>(b & 0x7F) << shift;
        if (!(b & 0x80)) return true;
        shift += 7;
        if (shift >= 64) return false;
    }
    return false;
}

static void write_string(Buffer& buf, const std::string& s) {
    write_varint(buf, s.size());
    buf.insert(buf.end(), s.begin(), s.end());
}

static bool read_string(const uint8_t*& p, const uint8_t* end, std::string& s) {
    uint64_t len;
    if (!read_varint(p, end, len)) return false;
    if (len > static_cast<uint64_t>(end - p)) return false;
    s.assign(reinterpret_cast<const char*>(p), static_cast<size_t>(len));
    p += len;
    return true;
}

static Buffer begin() {
    return Buffer(MAGIC, MAGIC + MAGIC_LEN);
}

static bool check_magic(const uint8_t*& p, const uint8_t* end) {
    if (static_cast<size_t>(end - p) < MAGIC_LEN || std::memcmp(p, MAGIC, MAGIC_LEN) != 0) {
        return false;
    }
    p += MAGIC_LEN;
    return true;
}

static Buffer encode_list(const std::vector<std::string>& list) {
    Buffer buf = begin();
    write_varint(buf, list.size());
    for (const auto& s : list) write_string(buf, s);
    return buf;
}

static bool decode_list(const uint8_t* p, const uint8_t* end, std::vector<std::string>& out) {
    if (!check_magic(p, end)) return false;
    uint64_t n;
    if (!read_varint(p, end, n)) return false;
    out.clear();
    for (uint64_t i = 0; i < n; ++i) {
        std::string s;
        if (!read_string(p, end, s)) return false;
        out.push_back(std::move(s));
    }
    return p == end;
}

static Buffer encode_map(const std::map<std::string, std::string>& m) {
    Buffer buf = begin();
    write_varint(buf, m.size());
    for (const auto& [k, v] : m) {
        write_string(buf, k);
        write_string(buf, v);
    }
    return buf;
}

static bool decode_map(const uint8_t* p, const uint8_t* end,
                       std::map<std::string, std::string>& out) {
    if (!check_magic(p, end)) return false;
    uint64_t n;
    if (!read_varint(p, end, n)) return false;
    out.clear();
    for (uint64_t i = 0; i < n; ++i) {
        std::string k, v;
        if (!read_string(p, end, k) || !read_string(p, end, v)) return false;
        out.emplace(std::move(k), std::move(v));
    }
    return p == end;
}

static Buffer encode_properties(const PropertyMap& props) {
    Buffer buf = begin();
    write_varint(buf, props.size());
    for (const auto& [key, value] : props) {
        write_string(buf, key);
        buf.push_back(static_cast<uint8_t>(value.index()));
        if (auto s = std::get_if<std::string>(&value)) {
            write_string(buf, *s);
        } else if (auto b = std::get_if<bool>(&value)) {
            buf.push_back(*b ? 1 : 0);
        } else if (auto i = std::get_if<int64_t>(&value)) {
            write_varint(buf, static_cast<uint64_t>(*i));
        } else {
            const auto& list = std::get<std::vector<std::string>>(value);
            write_varint(buf, list.size());
            for (const auto& s : list) write_string(buf, s);
        }
    }
    return buf;
}

static bool decode_properties(const uint8_t* p, const uint8_t* end, PropertyMap& out) {
    if (!check_magic(p, end)) return false;
    uint64_t n;
    if (!read_varint(p, end, n)) return false;
    out.clear();
    for (uint64_t i = 0; i < n; ++i) {
        std::string key;
        if (!read_string(p, end, key) || p >= end) return false;
        uint8_t type = *p++;
        switch (type) {
            case 0: {
                std::string s;
                if (!read_string(p, end, s)) return false;
                out[key] = std::move(s);
                break;
            }
            case 1:
                if (p >= end) return false;
                out[key] = (*p++ != 0);
                break;
            case 2: {
                uint64_t raw;
                if (!read_varint(p, end, raw)) return false;
                out[key] = static_cast<int64_t>(raw);
                break;
            }
            case 3: {
                uint64_t count;
                if (!read_varint(p, end, count)) return false;
                std::vector<std::string> list;
                for (uint64_t j = 0; j < count; ++j) {
                    std::string s;
                    if (!read_string(p, end, s)) return false;
                    list.push_back(std::move(s));
                }
                out[key] = std::move(list);
                break;
            }
            default:
                return false;
        }
    }
    return p == end;
}

} // namespace ser

// ---------------------------------------------------------------------------
// Fingerprints
// ---------------------------------------------------------------------------

Fingerprint StateStore::fingerprint_inputs(const FingerprintInputs& inputs) {
    Hasher own;
    own.field("step", std::string(step_name(inputs.step)));
    for (const auto& [key, value] : inputs.properties) {
        std::string tag = "prop:" + key;
        std::visit([&](const auto& v) { own.field(tag, v); }, value);
    }
    for (const auto& [key, value] : inputs.options) {
        own.field("opt:" + key, value);
    }
    own.field("source", inputs.source_identity);

    Hasher deps;
    for (const auto& [key, fp] : inputs.upstream) {
        deps.field("dep:" + key, fp);
    }

    Fingerprint fp;
    fp.inputs_hash = own.hex();
    fp.deps_hash = deps.hex();
    fp.value = Hasher().field("inputs", fp.inputs_hash).field("deps", fp.deps_hash).hex();
    return fp;
}

// ---------------------------------------------------------------------------
// pImpl
// ---------------------------------------------------------------------------

static const std::string SCHEMA_VERSION = "1";

struct StateStore::Impl {
    sqlite3* db = nullptr;

    sqlite3_stmt* stmt_get = nullptr;
    sqlite3_stmt* stmt_put = nullptr;
    sqlite3_stmt* stmt_delete = nullptr;
    sqlite3_stmt* stmt_keys = nullptr;
    sqlite3_stmt* stmt_next_serial = nullptr;
    sqlite3_stmt* stmt_owner = nullptr;
    sqlite3_stmt* stmt_history = nullptr;
    sqlite3_stmt* stmt_owned_by = nullptr;
    sqlite3_stmt* stmt_next_seq = nullptr;
    sqlite3_stmt* stmt_claim = nullptr;
    sqlite3_stmt* stmt_release = nullptr;

    ~Impl() {
        finalize_all();
        if (db) sqlite3_close(db);
    }

    void finalize_all() {
        auto fin = [](sqlite3_stmt*& s) {
            if (s) { sqlite3_finalize(s); s = nullptr; }
        };
        fin(stmt_get);
        fin(stmt_put);
        fin(stmt_delete);
        fin(stmt_keys);
        fin(stmt_next_serial);
        fin(stmt_owner);
        fin(stmt_history);
        fin(stmt_owned_by);
        fin(stmt_next_seq);
        fin(stmt_claim);
        fin(stmt_release);
    }

    Status require_open() const {
        if (!db) return StrataError(StrataError::IO, "state store is not open");
        return ok_status();
    }

    Status prepare(const char* sql, sqlite3_stmt*& out) {
        STRATA_TRY(require_open());
        if (out) {
            sqlite3_reset(out);
            sqlite3_clear_bindings(out);
            return ok_status();
        }
        int rc = sqlite3_prepare_v2(db, sql, -1, &out, nullptr);
        if (rc != SQLITE_OK) {
            return StrataError(StrataError::IO,
                std::string("SQLite prepare failed: ") + sqlite3_errmsg(db));
        }
        return ok_status();
    }

    Status exec(const char* sql) {
        char* errmsg = nullptr;
        int rc = sqlite3_exec(db, sql, nullptr, nullptr, &errmsg);
        if (rc != SQLITE_OK) {
            std::string msg = errmsg ? errmsg : "unknown error";
            sqlite3_free(errmsg);
            return StrataError(StrataError::IO, "SQLite exec failed: " + msg);
        }
        return ok_status();
    }

    Status step_done(sqlite3_stmt* stmt, const char* what) {
        int rc = sqlite3_step(stmt);
        sqlite3_reset(stmt);
        if (rc != SQLITE_DONE) {
            return StrataError(StrataError::IO,
                std::string("failed to ") + what + ": " + sqlite3_errmsg(db));
        }
        return ok_status();
    }

    // Run fn inside BEGIN IMMEDIATE / COMMIT, rolling back on failure
    template<typename F>
    Status transaction(F&& fn) {
        STRATA_TRY(exec("BEGIN IMMEDIATE;"));
        auto r = fn();
        if (r.is_err()) {
            auto rb = exec("ROLLBACK;");
            if (rb.is_err()) log::warn("%s", rb.error().message.c_str());
            return r;
        }
        return exec("COMMIT;");
    }

    Status init_schema() {
        STRATA_TRY(exec(
            "CREATE TABLE IF NOT EXISTS schema_info ("
            "  key TEXT PRIMARY KEY,"
            "  value TEXT"
            ");"
            "CREATE TABLE IF NOT EXISTS step_state ("
            "  part TEXT NOT NULL,"
            "  step INTEGER NOT NULL,"
            "  format INTEGER NOT NULL,"
            "  fingerprint TEXT NOT NULL,"
            "  inputs_hash TEXT NOT NULL,"
            "  deps_hash TEXT NOT NULL,"
            "  properties BLOB,"
            "  options BLOB,"
            "  source_identity TEXT,"
            "  upstream BLOB,"
            "  files BLOB,"
            "  directories BLOB,"
            "  details BLOB,"
            "  serial INTEGER NOT NULL,"
            "  created_at INTEGER,"
            "  PRIMARY KEY (part, step)"
            ");"
            "CREATE TABLE IF NOT EXISTS ownership ("
            "  area TEXT NOT NULL,"
            "  path TEXT NOT NULL,"
            "  part TEXT NOT NULL,"
            "  step INTEGER NOT NULL,"
            "  kind INTEGER NOT NULL,"
            "  digest TEXT,"
            "  seq INTEGER NOT NULL,"
            "  PRIMARY KEY (area, path, part)"
            ");"
            "CREATE INDEX IF NOT EXISTS ownership_by_part ON ownership (area, part);"
        ));

        std::string ver_sql = "INSERT OR REPLACE INTO schema_info (key, value) "
            "VALUES ('version', '" + SCHEMA_VERSION + "');";

        sqlite3_stmt* stmt = nullptr;
        int rc = sqlite3_prepare_v2(db,
            "SELECT value FROM schema_info WHERE key='version'", -1, &stmt, nullptr);
        if (rc != SQLITE_OK) {
            if (stmt) sqlite3_finalize(stmt);
            return StrataError(StrataError::IO,
                std::string("cannot read schema version: ") + sqlite3_errmsg(db));
        }
        rc = sqlite3_step(stmt);
        std::string found;
        if (rc == SQLITE_ROW) {
            auto ver = reinterpret_cast<const char*>(sqlite3_column_text(stmt, 0));
            found = ver ? ver : "";
        }
        sqlite3_finalize(stmt);

        if (rc == SQLITE_ROW && found != SCHEMA_VERSION) {
            log::warn("state schema version %s does not match %s, discarding recorded state",
                      found.c_str(), SCHEMA_VERSION.c_str());
            STRATA_TRY(exec("DELETE FROM step_state; DELETE FROM ownership;"));
        }
        if (rc != SQLITE_ROW || found != SCHEMA_VERSION) {
            STRATA_TRY(exec(ver_sql.c_str()));
        }
        return ok_status();
    }
};

// ---------------------------------------------------------------------------
// StateStore public interface
// ---------------------------------------------------------------------------

StateStore::StateStore() : impl_(std::make_unique<Impl>()) {}
StateStore::~StateStore() = default;
StateStore::StateStore(StateStore&&) noexcept = default;
StateStore& StateStore::operator=(StateStore&&) noexcept = default;

Status StateStore::open(const std::string& db_path) {
    close();

    fs::path parent = fs::path(db_path).parent_path();
    if (!parent.empty()) {
        std::error_code ec;
        fs::create_directories(parent, ec);
        if (ec) {
            return StrataError(StrataError::IO,
                "failed to create state directory: " + parent.string());
        }
    }

    auto connect = [&]() -> Status {
        int rc = sqlite3_open(db_path.c_str(), &impl_->db);
        if (rc != SQLITE_OK) {
            std::string msg = impl_->db ? sqlite3_errmsg(impl_->db) : "out of memory";
            if (impl_->db) { sqlite3_close(impl_->db); impl_->db = nullptr; }
            return StrataError(StrataError::IO, "failed to open state database: " + msg);
        }
        sqlite3_busy_timeout(impl_->db, 5000);
        STRATA_TRY(impl_->exec(
            "PRAGMA journal_mode=WAL;"
            "PRAGMA synchronous=NORMAL;"
        ));
        return impl_->init_schema();
    };

    auto first = connect();
    if (first.is_err()) {
        log::warn("state database %s is unusable (%s), recreating it",
                  db_path.c_str(), first.error().message.c_str());
        close();
        std::error_code ec;
        fs::remove(db_path, ec);
        fs::remove(db_path + "-wal", ec);
        fs::remove(db_path + "-shm", ec);
        auto second = connect();
        if (second.is_err()) {
            close();
            return second;
        }
    }
    return ok_status();
}

void StateStore::close() {
    if (impl_ && impl_->db) {
        impl_->finalize_all();
        sqlite3_close(impl_->db);
        impl_->db = nullptr;
    }
}

bool StateStore::is_open() const {
    return impl_ && impl_->db != nullptr;
}

static std::string column_text(sqlite3_stmt* stmt, int col) {
    auto p = reinterpret_cast<const char*>(sqlite3_column_text(stmt, col));
    return p ? std::string(p) : std::string();
}

// Blob column as [begin, end); empty blobs yield begin == end
static std::pair<const uint8_t*, const uint8_t*> column_blob(sqlite3_stmt* stmt, int col) {
    auto p = static_cast<const uint8_t*>(sqlite3_column_blob(stmt, col));
    int n = sqlite3_column_bytes(stmt, col);
    if (!p || n <= 0) return {nullptr, nullptr};
    return {p, p + n};
}

static void bind_blob(sqlite3_stmt* stmt, int idx, const ser::Buffer& buf) {
    sqlite3_bind_blob(stmt, idx, buf.data(), static_cast<int>(buf.size()), SQLITE_TRANSIENT);
}

Result<std::optional<StepState>> StateStore::get(const std::string& part, Step step) {
    using Out = Result<std::optional<StepState>>;
    STRATA_TRY(impl_->prepare(
        "SELECT format, fingerprint, inputs_hash, deps_hash, properties, options, "
        "source_identity, upstream, files, directories, details, serial, created_at "
        "FROM step_state WHERE part=? AND step=?",
        impl_->stmt_get));

    sqlite3_stmt* stmt = impl_->stmt_get;
    sqlite3_bind_text(stmt, 1, part.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_int(stmt, 2, static_cast<int>(step));

    int rc = sqlite3_step(stmt);
    if (rc == SQLITE_DONE) {
        sqlite3_reset(stmt);
        return Out::ok(std::nullopt);
    }
    if (rc != SQLITE_ROW) {
        std::string msg = sqlite3_errmsg(impl_->db);
        sqlite3_reset(stmt);
        return StrataError(StrataError::IO, "failed to read step state: " + msg);
    }

    std::string key = part + ":" + step_name(step);
    int format = sqlite3_column_int(stmt, 0);
    if (format != RECORD_FORMAT) {
        sqlite3_reset(stmt);
        StrataError err(StrataError::StateCorruption,
            "state for " + key + " has unknown format " + std::to_string(format));
        log::warn("%s, treating it as absent", err.message.c_str());
        return Out::ok(std::nullopt);
    }

    StepState st;
    st.part = part;
    st.step = step;
    st.fingerprint.value = column_text(stmt, 1);
    st.fingerprint.inputs_hash = column_text(stmt, 2);
    st.fingerprint.deps_hash = column_text(stmt, 3);
    st.source_identity = column_text(stmt, 6);
    st.serial = sqlite3_column_int64(stmt, 11);
    st.created_at = sqlite3_column_int64(stmt, 12);

    bool ok = true;
    auto [pb, pe] = column_blob(stmt, 4);
    ok = ok && ser::decode_properties(pb, pe, st.properties);
    auto [ob, oe] = column_blob(stmt, 5);
    ok = ok && ser::decode_map(ob, oe, st.options);
    auto [ub, ue] = column_blob(stmt, 7);
    ok = ok && ser::decode_map(ub, ue, st.upstream);
    auto [fb, fe] = column_blob(stmt, 8);
    ok = ok && ser::decode_list(fb, fe, st.files);
    auto [db_, de] = column_blob(stmt, 9);
    ok = ok && ser::decode_list(db_, de, st.directories);
    auto [xb, xe] = column_blob(stmt, 10);
    ok = ok && ser::decode_map(xb, xe, st.details);
    sqlite3_reset(stmt);

    if (!ok || st.fingerprint.value.empty()) {
        StrataError err(StrataError::StateCorruption, "state for " + key + " is unreadable");
        log::warn("%s, treating it as absent", err.message.c_str());
        return Out::ok(std::nullopt);
    }
    return Out::ok(std::move(st));
}

Status StateStore::put(const StepState& state) {
    STRATA_TRY(impl_->prepare(
        "SELECT COALESCE(MAX(serial), 0) + 1 FROM step_state",
        impl_->stmt_next_serial));
    STRATA_TRY(impl_->prepare(
        "INSERT OR REPLACE INTO step_state (part, step, format, fingerprint, inputs_hash, "
        "deps_hash, properties, options, source_identity, upstream, files, directories, "
        "details, serial, created_at) VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?)",
        impl_->stmt_put));

    auto now = std::chrono::system_clock::now().time_since_epoch();
    auto epoch_sec = std::chrono::duration_cast<std::chrono::seconds>(now).count();

    return impl_->transaction([&]() -> Status {
        sqlite3_stmt* next = impl_->stmt_next_serial;
        int64_t serial = 1;
        if (sqlite3_step(next) == SQLITE_ROW) serial = sqlite3_column_int64(next, 0);
        sqlite3_reset(next);

        sqlite3_stmt* stmt = impl_->stmt_put;
        sqlite3_bind_text(stmt, 1, state.part.c_str(), -1, SQLITE_TRANSIENT);
        sqlite3_bind_int(stmt, 2, static_cast<int>(state.step));
        sqlite3_bind_int(stmt, 3, RECORD_FORMAT);
        sqlite3_bind_text(stmt, 4, state.fingerprint.value.c_str(), -1, SQLITE_TRANSIENT);
        sqlite3_bind_text(stmt, 5, state.fingerprint.inputs_hash.c_str(), -1, SQLITE_TRANSIENT);
        sqlite3_bind_text(stmt, 6, state.fingerprint.deps_hash.c_str(), -1, SQLITE_TRANSIENT);
        bind_blob(stmt, 7, ser::encode_properties(state.properties));
        bind_blob(stmt, 8, ser::encode_map(state.options));
        sqlite3_bind_text(stmt, 9, state.source_identity.c_str(), -1, SQLITE_TRANSIENT);
        bind_blob(stmt, 10, ser::encode_map(state.upstream));
        bind_blob(stmt, 11, ser::encode_list(state.files));
        bind_blob(stmt, 12, ser::encode_list(state.directories));
        bind_blob(stmt, 13, ser::encode_map(state.details));
        sqlite3_bind_int64(stmt, 14, serial);
        sqlite3_bind_int64(stmt, 15, epoch_sec);
        return impl_->step_done(stmt, "store step state");
    });
}

Status StateStore::invalidate(const std::string& part, Step step) {
    STRATA_TRY(impl_->prepare(
        "DELETE FROM step_state WHERE part=? AND step=?",
        impl_->stmt_delete));
    sqlite3_bind_text(impl_->stmt_delete, 1, part.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_int(impl_->stmt_delete, 2, static_cast<int>(step));
    return impl_->step_done(impl_->stmt_delete, "invalidate step state");
}

Result<std::vector<StepKey>> StateStore::keys() {
    STRATA_TRY(impl_->prepare(
        "SELECT part, step FROM step_state ORDER BY serial",
        impl_->stmt_keys));
    std::vector<StepKey> out;
    int rc;
    while ((rc = sqlite3_step(impl_->stmt_keys)) == SQLITE_ROW) {
        out.push_back(StepKey{column_text(impl_->stmt_keys, 0),
                              static_cast<Step>(sqlite3_column_int(impl_->stmt_keys, 1))});
    }
    sqlite3_reset(impl_->stmt_keys);
    if (rc != SQLITE_DONE) {
        return StrataError(StrataError::IO,
            std::string("failed to list step states: ") + sqlite3_errmsg(impl_->db));
    }
    return Result<std::vector<StepKey>>::ok(std::move(out));
}

Status StateStore::clear() {
    STRATA_TRY(impl_->require_open());
    return impl_->exec("DELETE FROM step_state; DELETE FROM ownership;");
}

// ---------------------------------------------------------------------------
// Ownership
// ---------------------------------------------------------------------------

static OwnershipRecord read_record(sqlite3_stmt* stmt, Area area) {
    OwnershipRecord r;
    r.area = area;
    r.path = column_text(stmt, 0);
    r.part = column_text(stmt, 1);
    r.step = static_cast<Step>(sqlite3_column_int(stmt, 2));
    r.kind = static_cast<EntryKind>(sqlite3_column_int(stmt, 3));
    r.digest = column_text(stmt, 4);
    r.seq = sqlite3_column_int64(stmt, 5);
    return r;
}

static Result<std::vector<OwnershipRecord>> collect_records(sqlite3* db, sqlite3_stmt* stmt,
                                                            Area area) {
    std::vector<OwnershipRecord> out;
    int rc;
    while ((rc = sqlite3_step(stmt)) == SQLITE_ROW) {
        out.push_back(read_record(stmt, area));
    }
    sqlite3_reset(stmt);
    if (rc != SQLITE_DONE) {
        return StrataError(StrataError::IO,
            std::string("failed to read ownership: ") + sqlite3_errmsg(db));
    }
    return Result<std::vector<OwnershipRecord>>::ok(std::move(out));
}

Result<std::vector<OwnershipRecord>> StateStore::history(Area area, const std::string& path) {
    STRATA_TRY(impl_->prepare(
        "SELECT path, part, step, kind, digest, seq FROM ownership "
        "WHERE area=? AND path=? ORDER BY seq DESC",
        impl_->stmt_history));
    sqlite3_bind_text(impl_->stmt_history, 1, area_name(area), -1, SQLITE_STATIC);
    sqlite3_bind_text(impl_->stmt_history, 2, path.c_str(), -1, SQLITE_TRANSIENT);
    return collect_records(impl_->db, impl_->stmt_history, area);
}

Result<std::optional<OwnershipRecord>> StateStore::owner_of(Area area, const std::string& path) {
    STRATA_TRY(impl_->prepare(
        "SELECT path, part, step, kind, digest, seq FROM ownership "
        "WHERE area=? AND path=? ORDER BY seq DESC LIMIT 1",
        impl_->stmt_owner));
    sqlite3_bind_text(impl_->stmt_owner, 1, area_name(area), -1, SQLITE_STATIC);
    sqlite3_bind_text(impl_->stmt_owner, 2, path.c_str(), -1, SQLITE_TRANSIENT);
    auto rows = collect_records(impl_->db, impl_->stmt_owner, area);
    if (rows.is_err()) return std::move(rows).error();
    std::optional<OwnershipRecord> out;
    if (!rows.value().empty()) out = std::move(rows.value().front());
    return Result<std::optional<OwnershipRecord>>::ok(std::move(out));
}

Result<std::vector<OwnershipRecord>> StateStore::owned_by(Area area, const std::string& part) {
    STRATA_TRY(impl_->prepare(
        "SELECT path, part, step, kind, digest, seq FROM ownership "
        "WHERE area=? AND part=? ORDER BY path",
        impl_->stmt_owned_by));
    sqlite3_bind_text(impl_->stmt_owned_by, 1, area_name(area), -1, SQLITE_STATIC);
    sqlite3_bind_text(impl_->stmt_owned_by, 2, part.c_str(), -1, SQLITE_TRANSIENT);
    return collect_records(impl_->db, impl_->stmt_owned_by, area);
}

Status StateStore::claim(const std::vector<OwnershipRecord>& records) {
    if (records.empty()) return ok_status();
    STRATA_TRY(impl_->prepare(
        "SELECT COALESCE(MAX(seq), 0) + 1 FROM ownership",
        impl_->stmt_next_seq));
    STRATA_TRY(impl_->prepare(
        "INSERT OR REPLACE INTO ownership (area, path, part, step, kind, digest, seq) "
        "VALUES (?, ?, ?, ?, ?, ?, ?)",
        impl_->stmt_claim));

    return impl_->transaction([&]() -> Status {
        sqlite3_stmt* next = impl_->stmt_next_seq;
        int64_t seq = 1;
        if (sqlite3_step(next) == SQLITE_ROW) seq = sqlite3_column_int64(next, 0);
        sqlite3_reset(next);

        sqlite3_stmt* stmt = impl_->stmt_claim;
        for (const auto& r : records) {
            sqlite3_clear_bindings(stmt);
            sqlite3_bind_text(stmt, 1, area_name(r.area), -1, SQLITE_STATIC);
            sqlite3_bind_text(stmt, 2, r.path.c_str(), -1, SQLITE_TRANSIENT);
            sqlite3_bind_text(stmt, 3, r.part.c_str(), -1, SQLITE_TRANSIENT);
            sqlite3_bind_int(stmt, 4, static_cast<int>(r.step));
            sqlite3_bind_int(stmt, 5, static_cast<int>(r.kind));
            sqlite3_bind_text(stmt, 6, r.digest.c_str(), -1, SQLITE_TRANSIENT);
            sqlite3_bind_int64(stmt, 7, seq);
            STRATA_TRY(impl_->step_done(stmt, "record ownership"));
        }
        return ok_status();
    });
}

Status StateStore::release(Area area, const std::string& part,
                           const std::vector<std::string>& paths) {
    if (paths.empty()) return ok_status();
    STRATA_TRY(impl_->prepare(
        "DELETE FROM ownership WHERE area=? AND part=? AND path=?",
        impl_->stmt_release));

    return impl_->transaction([&]() -> Status {
        sqlite3_stmt* stmt = impl_->stmt_release;
        for (const auto& path : paths) {
            sqlite3_clear_bindings(stmt);
            sqlite3_bind_text(stmt, 1, area_name(area), -1, SQLITE_STATIC);
            sqlite3_bind_text(stmt, 2, part.c_str(), -1, SQLITE_TRANSIENT);
            sqlite3_bind_text(stmt, 3, path.c_str(), -1, SQLITE_TRANSIENT);
            STRATA_TRY(impl_->step_done(stmt, "release ownership"));
        }
        return ok_status();
    });
}

} // namespace strata
