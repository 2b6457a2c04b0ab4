#include "docstore/storage/document_store.hpp"

#include "docstore/catalog/catalog_errors.hpp"
#include "docstore/storage/document_codec.hpp"

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_string.hpp>

#include <algorithm>
#include <atomic>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <string>
#include <system_error>
#include <thread>
#include <vector>

using Catch::Matchers::ContainsSubstring;
using docstore::catalog::CatalogErrc;
using docstore::catalog::ColumnBlueprint;
using docstore::catalog::Row;
using docstore::catalog::Value;
using docstore::executor::Operation;
using docstore::executor::OperationLogRecord;
using docstore::storage::BatchOptions;
using docstore::storage::DocumentStore;
using docstore::storage::PersistencePolicy;

namespace {

std::filesystem::path make_unique_store_path()
{
    const auto base = std::filesystem::temp_directory_path();
    const auto stamp = std::chrono::steady_clock::now().time_since_epoch().count();
    return base / ("docstore_store_" + std::to_string(stamp));
}

struct TempStoreDirectory final {
    TempStoreDirectory()
        : path{make_unique_store_path()}
    {
        std::error_code ec;
        std::filesystem::remove_all(path, ec);
    }

    ~TempStoreDirectory()
    {
        std::error_code ec;
        std::filesystem::remove_all(path, ec);
    }

    std::filesystem::path path;
};

DocumentStore::Config make_store_config(std::filesystem::path path,
                                        PersistencePolicy policy = PersistencePolicy::PerOperation)
{
    DocumentStore::Config config{};
    config.path = std::move(path);
    config.persistence = policy;
    return config;
}

Operation create_notes()
{
    docstore::executor::CreateTableOperation create{};
    create.table = "notes";
    ColumnBlueprint id{};
    id.name = "id";
    id.data_type = "integer";
    id.is_primary_key = true;
    ColumnBlueprint body{};
    body.name = "body";
    body.data_type = "text";
    create.columns = {id, body};
    return create;
}

Operation insert_note(int id, std::string body)
{
    docstore::executor::InsertOperation insert{};
    insert.table = "notes";
    insert.rows = {Row{{"id", Value{id}}, {"body", Value{std::move(body)}}}};
    return insert;
}

Operation select_notes()
{
    docstore::executor::SelectOperation select{};
    select.table = "notes";
    return select;
}

std::uint64_t persisted_revision(const std::filesystem::path& path)
{
    docstore::catalog::Document document{};
    std::string message;
    const auto ec = docstore::storage::DocumentCodec::read_file(path, document, &message);
    CAPTURE(message);
    REQUIRE_FALSE(ec);
    return document.meta.revision;
}

}  // namespace

TEST_CASE("DocumentStore creates a fresh document when the file is missing")
{
    TempStoreDirectory temp;
    const auto path = temp.path / "store.json";

    DocumentStore store{make_store_config(path)};
    REQUIRE_FALSE(store.load());
    CHECK(std::filesystem::exists(path));
    CHECK(store.revision() == 0U);
    CHECK(store.snapshot().find_role("admin") != nullptr);
    CHECK(store.persistence_policy() == PersistencePolicy::PerOperation);
    CHECK(std::string{docstore::storage::to_string(PersistencePolicy::PerBatch)} == "per-batch");
}

TEST_CASE("DocumentStore persists every mutation and reloads it")
{
    TempStoreDirectory temp;
    const auto path = temp.path / "store.json";

    {
        DocumentStore store{make_store_config(path)};
        REQUIRE_FALSE(store.load());
        REQUIRE(store.execute(create_notes()).succeeded());
        REQUIRE(store.execute(insert_note(1, "first")).succeeded());
        CHECK(persisted_revision(path) == 2U);

        const auto read = store.execute(select_notes());
        REQUIRE(read.succeeded());
        CHECK(read.result_set->row_count == 1U);
        CHECK(store.revision() == 2U);
    }

    DocumentStore reopened{make_store_config(path)};
    REQUIRE_FALSE(reopened.load());
    CHECK(reopened.revision() == 2U);
    const auto snapshot = reopened.snapshot();
    REQUIRE(snapshot.find_table("notes") != nullptr);
    CHECK(snapshot.find_table("notes")->rows.front().at("body") == Value{"first"});
}

TEST_CASE("DocumentStore reports a corrupt document")
{
    TempStoreDirectory temp;
    std::filesystem::create_directories(temp.path);
    const auto path = temp.path / "store.json";
    {
        std::ofstream stream(path);
        stream << "{\"meta\": ";
    }

    DocumentStore store{make_store_config(path)};
    std::string message;
    CHECK(store.load(&message) == std::errc::invalid_argument);
    CHECK_FALSE(message.empty());
}

TEST_CASE("DocumentStore refuses to replace a document it cannot read")
{
    TempStoreDirectory temp;
    const auto path = temp.path / "store.json";
    std::filesystem::create_directories(path);
    const auto marker = path / "keep.txt";
    {
        std::ofstream stream(marker);
        stream << "existing data";
    }

    docstore::catalog::Document document{};
    CHECK(docstore::storage::DocumentCodec::read_file(path, document) == std::errc::is_a_directory);

    DocumentStore store{make_store_config(path)};
    const auto ec = store.load();
    CHECK(ec);
    CHECK(ec != std::errc::no_such_file_or_directory);
    CHECK(std::filesystem::is_directory(path));
    CHECK(std::filesystem::exists(marker));
    CHECK_FALSE(std::filesystem::exists(temp.path / "store.json.tmp"));
}

TEST_CASE("DocumentStore runs an in-memory document when no path is set")
{
    DocumentStore store{make_store_config({})};
    REQUIRE_FALSE(store.load());
    REQUIRE(store.execute(create_notes()).succeeded());
    CHECK(store.revision() == 1U);
    CHECK_FALSE(store.persist());
}

TEST_CASE("DocumentStore restores the document when persisting fails")
{
    TempStoreDirectory temp;
    std::filesystem::create_directories(temp.path);
    const auto blocker = temp.path / "blocker";
    {
        std::ofstream stream(blocker);
        stream << "not a directory";
    }

    DocumentStore store{make_store_config(blocker / "store.json")};
    CHECK(store.load());

    const auto result = store.execute(create_notes());
    CHECK(result.failed());
    CHECK(result.error == CatalogErrc::PersistenceFailed);
    CHECK_THAT(result.detail, ContainsSubstring("Failed to persist document: "));
    CHECK(store.revision() == 0U);
    CHECK(store.snapshot().find_table("notes") == nullptr);
}

TEST_CASE("DocumentStore batches keep running after a failed operation")
{
    DocumentStore store{make_store_config({})};
    REQUIRE_FALSE(store.load());

    const std::vector<Operation> operations{create_notes(), insert_note(1, "a"), insert_note(1, "dup"), insert_note(2, "b")};
    const auto outcome = store.execute_batch(operations);

    REQUIRE(outcome.ok());
    REQUIRE(outcome.results.size() == 4U);
    CHECK(outcome.results[0].succeeded());
    CHECK(outcome.results[1].succeeded());
    CHECK(outcome.results[2].error == CatalogErrc::ConflictError);
    CHECK(outcome.results[3].succeeded());
    CHECK(outcome.revision_before == 0U);
    CHECK(outcome.revision_after == 3U);
    REQUIRE(outcome.summary.find_table("notes") != nullptr);
    CHECK(outcome.summary.find_table("notes")->row_count == 2U);
}

TEST_CASE("DocumentStore rejects a batch on a revision mismatch")
{
    DocumentStore store{make_store_config({})};
    REQUIRE_FALSE(store.load());
    REQUIRE(store.execute(create_notes()).succeeded());

    BatchOptions options{};
    options.expected_revision = 0U;
    const std::vector<Operation> operations{insert_note(1, "late")};
    const auto outcome = store.execute_batch(operations, options);

    CHECK(outcome.error == CatalogErrc::ConflictError);
    CHECK(outcome.message == "Expected revision 0 but the document is at revision 1.");
    CHECK(outcome.results.empty());
    CHECK(store.revision() == 1U);
}

TEST_CASE("DocumentStore dry runs leave the document untouched")
{
    TempStoreDirectory temp;
    const auto path = temp.path / "store.json";
    DocumentStore store{make_store_config(path)};
    REQUIRE_FALSE(store.load());
    REQUIRE(store.execute(create_notes()).succeeded());

    BatchOptions options{};
    options.dry_run = true;
    const std::vector<Operation> operations{insert_note(1, "preview"), insert_note(2, "preview")};
    const auto outcome = store.execute_batch(operations, options);

    REQUIRE(outcome.ok());
    CHECK(outcome.results.size() == 2U);
    CHECK(outcome.revision_before == 1U);
    CHECK(outcome.revision_after == 3U);
    CHECK(outcome.summary.find_table("notes")->row_count == 2U);

    CHECK(store.revision() == 1U);
    CHECK(store.snapshot().find_table("notes")->rows.empty());
    CHECK(persisted_revision(path) == 1U);
}

TEST_CASE("DocumentStore per-batch persistence writes once per batch")
{
    TempStoreDirectory temp;
    const auto path = temp.path / "store.json";
    DocumentStore store{make_store_config(path, PersistencePolicy::PerBatch)};
    REQUIRE_FALSE(store.load());

    // A single operation outside a batch is written straight away.
    REQUIRE(store.execute(create_notes()).succeeded());
    CHECK(store.revision() == 1U);
    CHECK(persisted_revision(path) == 1U);

    const std::vector<Operation> operations{insert_note(1, "a"), insert_note(2, "b")};
    const auto outcome = store.execute_batch(operations);
    REQUIRE(outcome.ok());
    CHECK(outcome.revision_after == 3U);
    CHECK(persisted_revision(path) == 3U);
}

TEST_CASE("DocumentStore per-batch persistence failure rolls back every result")
{
    TempStoreDirectory temp;
    std::filesystem::create_directories(temp.path);
    const auto blocker = temp.path / "blocker";
    {
        std::ofstream stream(blocker);
        stream << "not a directory";
    }

    DocumentStore store{make_store_config(blocker / "store.json", PersistencePolicy::PerBatch)};
    CHECK(store.load());

    const std::vector<Operation> operations{create_notes(), insert_note(1, "a"), insert_note(1, "dup")};
    const auto outcome = store.execute_batch(operations);

    CHECK(outcome.error == CatalogErrc::PersistenceFailed);
    CHECK_THAT(outcome.message, ContainsSubstring("Failed to persist document: "));
    REQUIRE(outcome.results.size() == 3U);
    for (const auto& result : outcome.results) {
        CAPTURE(result.detail);
        CHECK(result.failed());
    }
    CHECK(outcome.results[0].error == CatalogErrc::PersistenceFailed);
    CHECK(outcome.results[1].error == CatalogErrc::PersistenceFailed);
    CHECK(outcome.results[1].rows_affected == 0U);
    CHECK(outcome.results[2].error == CatalogErrc::ConflictError);
    CHECK(outcome.revision_after == 0U);
    CHECK(store.snapshot().find_table("notes") == nullptr);
}

TEST_CASE("DocumentStore operation loggers may call back into the store")
{
    DocumentStore* observed = nullptr;
    std::vector<std::uint64_t> revisions;
    std::vector<OperationLogRecord> records;

    auto config = make_store_config({});
    config.executor.operation_logger = [&observed, &revisions, &records](const OperationLogRecord& record) {
        REQUIRE(observed != nullptr);
        revisions.push_back(observed->revision());
        CHECK(observed->summary().tables.size() <= 1U);
        records.push_back(record);
    };
    DocumentStore store{std::move(config)};
    observed = &store;
    REQUIRE_FALSE(store.load());

    REQUIRE(store.execute(create_notes()).succeeded());
    REQUIRE(store.execute_read(select_notes()).succeeded());
    const std::vector<Operation> operations{insert_note(1, "a")};
    REQUIRE(store.execute_batch(operations).ok());

    CHECK(revisions == std::vector<std::uint64_t>{1U, 1U, 2U});
    REQUIRE(records.size() == 3U);
    CHECK(std::none_of(records.begin(), records.end(), [](const OperationLogRecord& record) { return record.preview; }));
}

TEST_CASE("DocumentStore dry runs are logged as previews and skip telemetry")
{
    std::vector<OperationLogRecord> records;
    auto config = make_store_config({});
    config.executor.operation_logger = [&records](const OperationLogRecord& record) { records.push_back(record); };
    DocumentStore store{std::move(config)};
    REQUIRE_FALSE(store.load());
    REQUIRE(store.execute(create_notes()).succeeded());
    const auto attempts_before = store.executor().telemetry().snapshot().total_attempts();

    BatchOptions options{};
    options.dry_run = true;
    const std::vector<Operation> operations{insert_note(1, "preview")};
    REQUIRE(store.execute_batch(operations, options).ok());

    REQUIRE(records.size() == 2U);
    CHECK_FALSE(records[0].preview);
    CHECK(records[1].preview);
    CHECK(records[1].status == docstore::executor::ExecutionStatus::Success);
    CHECK(store.executor().telemetry().snapshot().total_attempts() == attempts_before);
    CHECK(store.revision() == 1U);
}

TEST_CASE("DocumentStore serves concurrent readers alongside a writer")
{
    DocumentStore store{make_store_config({})};
    REQUIRE_FALSE(store.load());
    REQUIRE(store.execute(create_notes()).succeeded());

    constexpr int kInserts = 50;
    std::atomic<bool> read_failure{false};
    std::atomic<bool> done{false};

    std::thread writer([&store, &done] {
        for (int id = 1; id <= kInserts; ++id) {
            if (!store.execute(insert_note(id, "row")).succeeded()) {
                break;
            }
        }
        done.store(true);
    });

    std::vector<std::thread> readers;
    for (int reader = 0; reader < 3; ++reader) {
        readers.emplace_back([&store, &done, &read_failure] {
            while (!done.load()) {
                const auto result = store.execute_read(select_notes());
                if (!result.succeeded() || result.result_set->row_count > static_cast<std::uint64_t>(kInserts)) {
                    read_failure.store(true);
                }
            }
        });
    }

    writer.join();
    for (auto& thread : readers) {
        thread.join();
    }

    CHECK_FALSE(read_failure.load());
    CHECK(store.revision() == static_cast<std::uint64_t>(kInserts) + 1U);
    CHECK(store.snapshot().find_table("notes")->rows.size() == static_cast<std::size_t>(kInserts));
}
