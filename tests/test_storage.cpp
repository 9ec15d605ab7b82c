#include "test_framework.hpp"

#include "transloom/storage/artifact_keys.hpp"
#include "transloom/storage/factory.hpp"
#include "transloom/storage/filesystem_store.hpp"
#include "transloom/storage/memory_store.hpp"
#include "tests/helpers/test_helpers.hpp"

#include <filesystem>
#include <future>
#include <memory>

namespace {

namespace s = transloom::storage;

// Shared contract checks, run against both backends.
void check_store_contract(s::ArtifactStore &store) {
  using transloom::tests::require;

  auto first = store.put("sess/translated_chunks/translated_chunk_0002.txt", "two");
  require(first.ok(), first.error());
  require(store.put("sess/translated_chunks/translated_chunk_0001.txt", "one").ok(), "put 1");
  require(store.put("sess/translated_chunks/final_translated_chunk_0001.txt", "final").ok(),
          "put final");
  require(store.put("other/translated_chunks/translated_chunk_0001.txt", "other").ok(),
          "put other session");

  auto listed = store.list_by_prefix(s::translated_prefix("sess"));
  require(listed.ok(), listed.error());
  require(listed.value().size() == 2, "prefix listing should skip finals and other sessions");
  require(listed.value()[0].key == "sess/translated_chunks/translated_chunk_0001.txt",
          "listing should be sorted by key");
  require(listed.value()[1].locator == first.value(), "listing locator matches put locator");

  auto by_locator = store.get(first.value());
  require(by_locator.ok() && by_locator.value() == "two", "get by locator");
  auto by_key = store.get("sess/translated_chunks/translated_chunk_0001.txt");
  require(by_key.ok() && by_key.value() == "one", "get by key");

  require(store.put("sess/translated_chunks/translated_chunk_0001.txt", "uno").ok(), "overwrite");
  require(store.get("sess/translated_chunks/translated_chunk_0001.txt").value() == "uno",
          "rewriting a key overwrites it");
  require(store.list_by_prefix(s::translated_prefix("sess")).value().size() == 2,
          "overwrite must not duplicate the artifact");

  require(store.exists("sess/translated_chunks/final_translated_chunk_0001.txt"), "exists");
  require(!store.exists("sess/translated_chunks/final_translated_chunk_0009.txt"), "missing");
  require(!store.get("sess/nothing.txt").ok(), "missing artifact should fail");

  auto empty = store.list_by_prefix("nobody/prompts_for_translation/");
  require(empty.ok() && empty.value().empty(), "unknown prefix lists nothing");

  require(store.put("sess/scratch.txt", "x").ok(), "put scratch");
  require(store.remove("sess/scratch.txt").ok(), "remove");
  require(!store.exists("sess/scratch.txt"), "removed artifact is gone");
  require(store.remove("sess/scratch.txt").ok(), "removing a missing key succeeds");

  auto binary = store.put("sess/blob.bin", std::string("\0\x01\xFF", 3));
  require(binary.ok(), binary.error());
  require(store.get("sess/blob.bin").value() == std::string("\0\x01\xFF", 3), "bytes preserved");
}

} // namespace

void register_storage_tests(std::vector<transloom::tests::TestCase> &tests) {
  using transloom::tests::require;

  tests.push_back({"artifact_key_layout", [] {
                     require(s::original_chunk_key("abc", 7) ==
                                 "abc/original_chunks/original_chunk_0007.txt",
                             "original chunk key");
                     require(s::prompt_key("abc", 1) ==
                                 "abc/prompts_for_translation/translation_prompt_chunk_0001.txt",
                             "prompt key");
                     require(s::translated_key("abc", 12) ==
                                 "abc/translated_chunks/translated_chunk_0012.txt",
                             "translated key");
                     require(s::final_key("abc", 3) ==
                                 "abc/translated_chunks/final_translated_chunk_0003.txt",
                             "final key");
                     require(s::singleton_key("abc", s::ENTITY_EXTRACTION_NAME) ==
                                 "abc/entity_extraction.txt",
                             "singleton key");
                     require(s::final_document_key("abc", "book.epub") == "abc/FINAL_book.epub",
                             "final document key");
                     require(s::sequence_name("x_", 12345) == "x_12345.txt",
                             "sequences past 9999 widen instead of wrapping");
                   }});

  tests.push_back({"artifact_key_derivations", [] {
                     const auto prompt = s::prompt_key("abc", 4);
                     const auto translated = s::translated_key_from_prompt(prompt);
                     require(translated == s::translated_key("abc", 4),
                             "prompt key maps to translated key");
                     require(s::final_key_from_translated(translated) == s::final_key("abc", 4),
                             "translated key maps to final key");
                     require(s::sequence_from_key(prompt) == std::optional<std::size_t>(4),
                             "sequence parsed from key");
                     require(s::sequence_from_key("mem://abc/translated_chunks/translated_chunk_0031.txt") ==
                                 std::optional<std::size_t>(31),
                             "sequence parsed from locator");
                     require(!s::sequence_from_key("abc/entity_extraction.txt").has_value(),
                             "singleton has no sequence");
                     require(!s::sequence_from_key("abc/chunk0001.txt").has_value(),
                             "sequence requires an underscore");
                   }});

  tests.push_back({"memory_store_contract", [] {
                     s::MemoryArtifactStore store;
                     check_store_contract(store);
                     require(store.locator_for("a/b.txt") == "mem://a/b.txt", "memory locator");
                     require(store.write_count() == 7, "every put counts as a write");
                     require(store.size() == 5, "overwrite keeps one object");
                     require(!store.put("", "x").ok(), "empty key rejected");
                   }});

  tests.push_back({"filesystem_store_contract", [] {
                     transloom::testing::TempWorkspace workspace;
                     s::FilesystemArtifactStore store(workspace.path() / "artifacts");
                     check_store_contract(store);

                     const auto path = store.path_for("sess/blob.bin");
                     require(std::filesystem::exists(path), "artifact written below the root");
                     require(store.locator_for("sess/blob.bin") == "file://" + path.generic_string(),
                             "file locator is the absolute path");
                   }});

  tests.push_back({"filesystem_store_rejects_escaping_keys", [] {
                     transloom::testing::TempWorkspace workspace;
                     s::FilesystemArtifactStore store(workspace.path());
                     require(!store.put("../outside.txt", "x").ok(), "parent traversal rejected");
                     require(!store.put("/etc/absolute.txt", "x").ok(), "absolute key rejected");
                     require(!store.get("a/../../b.txt").ok(), "traversal on read rejected");
                     require(!store.exists("../outside.txt"), "traversal never exists");
                   }});

  tests.push_back({"filesystem_store_ignores_temp_files", [] {
                     transloom::testing::TempWorkspace workspace;
                     s::FilesystemArtifactStore store(workspace.path());
                     require(store.put(s::final_key("s", 1), "done").ok(), "put");
                     workspace.create_file("s/translated_chunks/final_translated_chunk_0002.txt.tmp",
                                           "partial");
                     auto listed = store.list_by_prefix(s::finals_prefix("s"));
                     require(listed.ok(), listed.error());
                     require(listed.value().size() == 1, "interrupted writes are not listed");
                   }});

  tests.push_back({"stores_accept_concurrent_distinct_writes", [] {
                     transloom::testing::TempWorkspace workspace;
                     const std::vector<std::shared_ptr<s::ArtifactStore>> stores = {
                         std::make_shared<s::MemoryArtifactStore>(),
                         std::make_shared<s::FilesystemArtifactStore>(workspace.path())};
                     for (const auto &store : stores) {
                       std::vector<std::future<bool>> writers;
                       for (std::size_t i = 1; i <= 32; ++i) {
                         writers.push_back(std::async(std::launch::async, [store, i] {
                           return store->put(s::original_chunk_key("c", i), std::to_string(i)).ok();
                         }));
                       }
                       for (auto &writer : writers) {
                         require(writer.get(), store->name() + ": concurrent put failed");
                       }
                       auto listed = store->list_by_prefix(s::original_chunks_prefix("c"));
                       require(listed.ok() && listed.value().size() == 32,
                               store->name() + ": all writes visible");
                       require(store->get(listed.value()[9].locator).value() == "10",
                               store->name() + ": zero padding keeps numeric order");
                     }
                   }});

  tests.push_back({"storage_factory_backends", [] {
                     transloom::testing::TempWorkspace workspace;
                     transloom::config::StorageConfig config;
                     config.backend = "memory";
                     auto memory = s::create_artifact_store(config);
                     require(memory.ok() && memory.value()->name() == "memory", "memory backend");

                     config.backend = "FileSystem";
                     config.root = (workspace.path() / "nested" / "root").string();
                     auto filesystem = s::create_artifact_store(config);
                     require(filesystem.ok(), filesystem.error());
                     require(filesystem.value()->name() == "filesystem", "filesystem backend");
                     require(std::filesystem::is_directory(workspace.path() / "nested" / "root"),
                             "root directory created");

                     config.backend = "s3";
                     require(!s::create_artifact_store(config).ok(), "unknown backend fails");
                   }});
}
