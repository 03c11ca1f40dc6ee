#include <catch2/catch.hpp>
#include <vector>

#include <lrp/entry_registry.hpp>
#include <lrp/log_writer.hpp>

using namespace lrp;

static std::vector<Record> records_of(const Bytes& buf) {
  LogReader r(buf);
  return std::vector<Record>(r.begin(), r.end());
}

TEST_CASE("start registers, metadata overwrites, finish retires") {
  LogWriter w;
  w.start(4, "/shooter/rpm", "double", "m0", 0);
  w.set_metadata(4, "m1", 1);
  w.finish(4, 2);
  const Bytes buf = w.take();
  const auto recs = records_of(buf);

  EntryRegistry reg;
  REQUIRE(reg.apply(recs[0]) == EntryRegistry::Applied::Started);
  const LogEntry* e = reg.resolve(4);
  REQUIRE(e != nullptr);
  REQUIRE(e->name == "/shooter/rpm");
  REQUIRE(e->type == ValueType::Double);
  REQUIRE(e->metadata == "m0");

  REQUIRE(reg.apply(recs[1]) == EntryRegistry::Applied::MetadataSet);
  REQUIRE(reg.resolve(4)->metadata == "m1");

  REQUIRE(reg.apply(recs[2]) == EntryRegistry::Applied::Finished);
  REQUIRE(reg.resolve(4) == nullptr);
  REQUIRE(reg.size() == 0);
}

TEST_CASE("metadata for an unknown entry is ignored") {
  LogWriter w;
  w.set_metadata(99, "orphan", 0);
  const Bytes buf = w.take();
  const auto recs = records_of(buf);

  EntryRegistry reg;
  REQUIRE(reg.apply(recs[0]) == EntryRegistry::Applied::Ignored);
  REQUIRE(reg.size() == 0);
}

TEST_CASE("an id can be reused after finish with a new name and type") {
  LogWriter w;
  w.start(2, "old", "boolean", "", 0);
  w.finish(2, 1);
  w.start(2, "new", "string", "", 2);
  const Bytes buf = w.take();

  EntryRegistry reg;
  for (const auto& rec : records_of(buf)) reg.apply(rec);
  REQUIRE(reg.resolve(2) != nullptr);
  REQUIRE(reg.resolve(2)->name == "new");
  REQUIRE(reg.resolve(2)->type == ValueType::String);
}
