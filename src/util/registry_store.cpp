#include <scribe/registry_store.hpp>
#include <sqlite3.h>

#include <filesystem>

namespace fs = std::filesystem;

namespace scribe {

// ---------------------------------------------------------------------------
// pImpl
// ---------------------------------------------------------------------------

static const std::string SCHEMA_VERSION = "1";

struct RegistryStore::Impl {
    sqlite3* db = nullptr;

    // Prepared statements (lazily initialized, cached)
    sqlite3_stmt* stmt_insert_object = nullptr;
    sqlite3_stmt* stmt_select_objects = nullptr;
    sqlite3_stmt* stmt_count_objects = nullptr;

    ~Impl() {
        finalize_all();
        if (db) sqlite3_close(db);
    }

    void finalize_all() {
        auto fin = [](sqlite3_stmt*& s) {
            if (s) { sqlite3_finalize(s); s = nullptr; }
        };
        fin(stmt_insert_object);
        fin(stmt_select_objects);
        fin(stmt_count_objects);
    }

    Status prepare(const char* sql, sqlite3_stmt*& out) {
        if (out) return ok_status();
        int rc = sqlite3_prepare_v2(db, sql, -1, &out, nullptr);
        if (rc != SQLITE_OK) {
            return ScribeError(ScribeError::IO,
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
            return ScribeError(ScribeError::IO, "SQLite exec failed: " + msg);
        }
        return ok_status();
    }

    Status write_version() {
        std::string ver_sql = "INSERT OR REPLACE INTO schema_info (key, value) "
            "VALUES ('version', '" + SCHEMA_VERSION + "');";
        return exec(ver_sql.c_str());
    }

    Status init_schema() {
        SCRIBE_TRY(exec(
            "CREATE TABLE IF NOT EXISTS schema_info ("
            "  key TEXT PRIMARY KEY,"
            "  value TEXT"
            ");"
            "CREATE TABLE IF NOT EXISTS code_object ("
            "  seq INTEGER PRIMARY KEY,"
            "  path TEXT UNIQUE,"
            "  type INTEGER,"
            "  name TEXT,"
            "  ns_path TEXT,"
            "  superclass_path TEXT,"
            "  scope INTEGER,"
            "  visibility INTEGER,"
            "  signature TEXT,"
            "  value TEXT,"
            "  file TEXT,"
            "  line INTEGER,"
            "  docstring TEXT,"
            "  source TEXT,"
            "  dynamic INTEGER"
            ");"
        ));

        // Check schema version
        sqlite3_stmt* stmt = nullptr;
        int rc = sqlite3_prepare_v2(db,
            "SELECT value FROM schema_info WHERE key='version'", -1, &stmt, nullptr);
        if (rc != SQLITE_OK) {
            if (stmt) sqlite3_finalize(stmt);
            return ScribeError(ScribeError::IO,
                std::string("SQLite prepare failed: ") + sqlite3_errmsg(db));
        }

        rc = sqlite3_step(stmt);
        if (rc == SQLITE_ROW) {
            const char* ver = reinterpret_cast<const char*>(sqlite3_column_text(stmt, 0));
            bool stale = ver && std::string(ver) != SCHEMA_VERSION;
            sqlite3_finalize(stmt);
            if (stale) {
                SCRIBE_TRY(exec("DELETE FROM code_object;"));
                SCRIBE_TRY(write_version());
            }
            return ok_status();
        }

        sqlite3_finalize(stmt);
        return write_version();
    }
};

namespace {

std::string column_string(sqlite3_stmt* stmt, int col) {
    const auto* text = sqlite3_column_text(stmt, col);
    return text ? reinterpret_cast<const char*>(text) : "";
}

void bind_string(sqlite3_stmt* stmt, int col, const std::string& s) {
    sqlite3_bind_text(stmt, col, s.c_str(), -1, SQLITE_TRANSIENT);
}

// Reference to `path` in `registry`, unresolved when it is not there yet
Reference lookup(Registry& registry, const std::string& path, CodeObjectType type) {
    if (auto* obj = registry.at(path)) return Reference(obj);
    return Reference::unresolved(path, type);
}

// Saved row, as read back
struct Row {
    std::string path;
    CodeObjectType type = CodeObjectType::Module;
    std::string name;
    std::string ns_path;
    std::string superclass_path;
    Scope scope = Scope::Instance;
    Visibility visibility = Visibility::Public;
    std::string signature;
    std::string value;
    std::string file;
    int line = 0;
    std::string docstring;
    std::string source;
    bool dynamic = false;
};

Result<CodeObject*> define_row(Registry& registry, const Row& row) {
    Reference ns = lookup(registry, row.ns_path, CodeObjectType::Module);

    switch (row.type) {
    case CodeObjectType::Module: {
        auto r = registry.define_module(ns, row.name);
        if (r.is_err()) return std::move(r).error();
        return Result<CodeObject*>::ok(r.value());
    }
    case CodeObjectType::Class: {
        Reference super;
        if (!row.superclass_path.empty()) {
            super = lookup(registry, row.superclass_path, CodeObjectType::Class);
        }
        auto r = registry.define_class(ns, row.name, std::move(super));
        if (r.is_err()) return std::move(r).error();
        return Result<CodeObject*>::ok(r.value());
    }
    case CodeObjectType::Method: {
        auto r = registry.define_method(ns, row.name, row.scope);
        if (r.is_err()) return std::move(r).error();
        r.value()->visibility = row.visibility;
        r.value()->signature = row.signature;
        return Result<CodeObject*>::ok(r.value());
    }
    case CodeObjectType::Constant: {
        auto r = registry.define_constant(ns, row.name, row.value);
        if (r.is_err()) return std::move(r).error();
        return Result<CodeObject*>::ok(r.value());
    }
    case CodeObjectType::ClassVariable: {
        auto r = registry.define_class_variable(ns, row.name, row.value);
        if (r.is_err()) return std::move(r).error();
        return Result<CodeObject*>::ok(r.value());
    }
    case CodeObjectType::Root:
        break;
    }
    return ScribeError{ScribeError::Parse,
        "stored object " + row.path + " has an invalid type"};
}

} // anonymous namespace

// ---------------------------------------------------------------------------
// RegistryStore public interface
// ---------------------------------------------------------------------------

RegistryStore::RegistryStore() : impl_(std::make_unique<Impl>()) {}
RegistryStore::~RegistryStore() = default;
RegistryStore::RegistryStore(RegistryStore&&) noexcept = default;
RegistryStore& RegistryStore::operator=(RegistryStore&&) noexcept = default;

std::string RegistryStore::default_path() {
    return ".scribe/registry.db";
}

Status RegistryStore::open(const std::string& db_path) {
    close();

    // Create parent directories
    fs::path parent = fs::path(db_path).parent_path();
    if (!parent.empty()) {
        std::error_code ec;
        fs::create_directories(parent, ec);
        if (ec) {
            return ScribeError(ScribeError::IO,
                "Failed to create registry directory: " + parent.string());
        }
    }

    int rc = sqlite3_open(db_path.c_str(), &impl_->db);
    if (rc != SQLITE_OK) {
        std::string err_msg = impl_->db ? sqlite3_errmsg(impl_->db) : "unknown";
        if (impl_->db) { sqlite3_close(impl_->db); impl_->db = nullptr; }
        return ScribeError(ScribeError::IO,
            "Failed to open registry database: " + err_msg, "", db_path, 0);
    }

    // Set PRAGMAs and init schema; if anything fails, delete and retry
    auto setup = [&]() -> Status {
        SCRIBE_TRY(impl_->exec(
            "PRAGMA journal_mode=WAL;"
            "PRAGMA synchronous=NORMAL;"
        ));
        SCRIBE_TRY(impl_->init_schema());
        return ok_status();
    };

    auto setup_result = setup();
    if (setup_result.is_err()) {
        // Corrupt DB: delete and retry once
        close();
        std::error_code ec;
        fs::remove(db_path, ec);
        fs::remove(db_path + "-wal", ec);
        fs::remove(db_path + "-shm", ec);
        rc = sqlite3_open(db_path.c_str(), &impl_->db);
        if (rc != SQLITE_OK) {
            if (impl_->db) { sqlite3_close(impl_->db); impl_->db = nullptr; }
            return ScribeError(ScribeError::IO, "Failed to recreate registry database",
                               "", db_path, 0);
        }
        SCRIBE_TRY(setup());
    }

    return ok_status();
}

void RegistryStore::close() {
    if (impl_->db) {
        impl_->finalize_all();
        sqlite3_close(impl_->db);
        impl_->db = nullptr;
    }
}

bool RegistryStore::is_open() const {
    return impl_->db != nullptr;
}

Status RegistryStore::save(const Registry& registry) {
    if (!impl_->db) return ScribeError(ScribeError::IO, "registry database is not open");

    SCRIBE_TRY(impl_->prepare(
        "INSERT OR REPLACE INTO code_object (path, type, name, ns_path, superclass_path, "
        "scope, visibility, signature, value, file, line, docstring, source, dynamic) "
        "VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?)",
        impl_->stmt_insert_object));

    SCRIBE_TRY(impl_->exec("BEGIN TRANSACTION; DELETE FROM code_object;"));

    auto* stmt = impl_->stmt_insert_object;
    for (auto* obj : registry.all()) {
        std::string superclass_path;
        int scope = 0;
        int visibility = 0;
        std::string signature;
        std::string value;

        switch (obj->type()) {
        case CodeObjectType::Class:
            superclass_path = static_cast<ClassObject*>(obj)->superclass().path();
            break;
        case CodeObjectType::Method: {
            auto* m = static_cast<MethodObject*>(obj);
            scope = static_cast<int>(m->scope());
            visibility = static_cast<int>(m->visibility);
            signature = m->signature;
            break;
        }
        case CodeObjectType::Constant:
            value = static_cast<ConstantObject*>(obj)->value;
            break;
        case CodeObjectType::ClassVariable:
            value = static_cast<ClassVariableObject*>(obj)->value;
            break;
        default:
            break;
        }

        sqlite3_reset(stmt);
        bind_string(stmt, 1, obj->path());
        sqlite3_bind_int(stmt, 2, static_cast<int>(obj->type()));
        bind_string(stmt, 3, obj->name());
        bind_string(stmt, 4, obj->ns_ref().path());
        bind_string(stmt, 5, superclass_path);
        sqlite3_bind_int(stmt, 6, scope);
        sqlite3_bind_int(stmt, 7, visibility);
        bind_string(stmt, 8, signature);
        bind_string(stmt, 9, value);
        bind_string(stmt, 10, obj->file);
        sqlite3_bind_int(stmt, 11, obj->line);
        bind_string(stmt, 12, obj->docstring);
        bind_string(stmt, 13, obj->source);
        sqlite3_bind_int(stmt, 14, obj->dynamic ? 1 : 0);

        int rc = sqlite3_step(stmt);
        if (rc != SQLITE_DONE) {
            std::string msg = sqlite3_errmsg(impl_->db);
            auto rollback = impl_->exec("ROLLBACK;");
            if (rollback.is_err()) msg += " (" + rollback.error().message + ")";
            return ScribeError(ScribeError::IO,
                "Failed to store " + obj->path() + ": " + msg);
        }
    }

    return impl_->exec("COMMIT;");
}

Status RegistryStore::load(Registry& registry) {
    if (!impl_->db) return ScribeError(ScribeError::IO, "registry database is not open");

    SCRIBE_TRY(impl_->prepare(
        "SELECT path, type, name, ns_path, superclass_path, scope, visibility, "
        "signature, value, file, line, docstring, source, dynamic "
        "FROM code_object ORDER BY seq",
        impl_->stmt_select_objects));

    auto* stmt = impl_->stmt_select_objects;
    sqlite3_reset(stmt);

    std::vector<Row> rows;
    int rc;
    while ((rc = sqlite3_step(stmt)) == SQLITE_ROW) {
        Row row;
        row.path = column_string(stmt, 0);
        row.type = static_cast<CodeObjectType>(sqlite3_column_int(stmt, 1));
        row.name = column_string(stmt, 2);
        row.ns_path = column_string(stmt, 3);
        row.superclass_path = column_string(stmt, 4);
        row.scope = static_cast<Scope>(sqlite3_column_int(stmt, 5));
        row.visibility = static_cast<Visibility>(sqlite3_column_int(stmt, 6));
        row.signature = column_string(stmt, 7);
        row.value = column_string(stmt, 8);
        row.file = column_string(stmt, 9);
        row.line = sqlite3_column_int(stmt, 10);
        row.docstring = column_string(stmt, 11);
        row.source = column_string(stmt, 12);
        row.dynamic = sqlite3_column_int(stmt, 13) != 0;
        rows.push_back(std::move(row));
    }
    if (rc != SQLITE_DONE) {
        return ScribeError(ScribeError::IO,
            std::string("Failed to read registry: ") + sqlite3_errmsg(impl_->db));
    }

    for (const auto& row : rows) {
        auto defined = define_row(registry, row);
        if (defined.is_err()) return std::move(defined).error();

        CodeObject* obj = defined.value();
        obj->file = row.file;
        obj->line = row.line;
        obj->docstring = row.docstring;
        obj->source = row.source;
        obj->dynamic = row.dynamic;

        // Children saved before their parent are adopted once it is loaded
        for (auto* ref : obj->references()) {
            if (!ref->is_resolved()) registry.add_pending(ref->path(), obj);
        }
    }
    return ok_status();
}

Result<int64_t> RegistryStore::object_count() {
    if (!impl_->db) return ScribeError(ScribeError::IO, "registry database is not open");

    SCRIBE_TRY(impl_->prepare("SELECT COUNT(*) FROM code_object",
                              impl_->stmt_count_objects));
    sqlite3_reset(impl_->stmt_count_objects);
    int rc = sqlite3_step(impl_->stmt_count_objects);
    if (rc != SQLITE_ROW) {
        return ScribeError(ScribeError::IO,
            std::string("Failed to count objects: ") + sqlite3_errmsg(impl_->db));
    }
    return Result<int64_t>::ok(sqlite3_column_int64(impl_->stmt_count_objects, 0));
}

} // namespace scribe
