#include "test_support.hpp"
#include "usage_ledger/codec.hpp"

#include <catch2/catch.hpp>

using namespace usage_ledger;
using namespace usage_ledger::testing;

TEST_CASE("byte reader refuses to read past the end", "[codec]") {
  ByteWriter w;
  w.put_u32(0xdeadbeef);
  w.put_string("abc");
  const auto bytes = w.take();

  ByteReader r(bytes.data(), bytes.size());
  std::uint32_t v = 0;
  REQUIRE(r.get_u32(&v));
  CHECK(v == 0xdeadbeef);
  std::string s;
  REQUIRE(r.get_string(&s));
  CHECK(s == "abc");
  CHECK(r.remaining() == 0);
  std::uint8_t b = 0;
  CHECK_FALSE(r.get_u8(&b));

  ByteReader cut(bytes.data(), bytes.size() - 1);
  REQUIRE(cut.get_u32(&v));
  CHECK_FALSE(cut.get_string(&s));
}

TEST_CASE("contributions are stored by model name, not key",
          "[codec][models]") {
  ModelInterner writer_side;
  writer_side.intern("padding-a");
  writer_side.intern("padding-b");
  const std::vector<Message> recs = {
      ai_msg(kDay0, "s", "gpt-4o", 1, 2, 0.5),
      ai_msg(kDay0 + kDaySecs, "t", "o3", 3, 4, 0.25)};
  const auto c =
      from_records(ContributionStrategy::MultiSession, recs, writer_side);

  ByteWriter w;
  ModelTable table(writer_side);
  put_contribution(w, c, table);
  REQUIRE(table.names().size() == 2);

  // The reader's process has never seen these models.
  ModelInterner reader_side;
  std::vector<ModelKey> remap;
  for (const auto &name : table.names())
    remap.push_back(*reader_side.intern(name));

  const auto bytes = w.take();
  ByteReader r(bytes.data(), bytes.size());
  Contribution back;
  REQUIRE(get_contribution(r, remap, &back));
  CHECK(back == from_records(ContributionStrategy::MultiSession, recs,
                             reader_side));

  ByteReader short_remap(bytes.data(), bytes.size());
  Contribution ignored;
  CHECK_FALSE(get_contribution(short_remap, {remap.front()}, &ignored));
}

TEST_CASE("cold payloads carry the identity they were parsed from",
          "[codec][records]") {
  const std::vector<Message> recs = {user_msg(kDay0, "s"),
                                     ai_msg(kDay0 + 3, "s", "o3", 9, 8, 0.75)};
  const FileIdentity id{123, 456789, 42};
  const auto bytes = encode_records(id, recs);

  FileIdentity got;
  std::vector<Message> out;
  std::string err;
  REQUIRE(decode_records(bytes, &got, &out, &err));
  CHECK(got == id);
  CHECK(out == recs);

  const std::vector<std::uint8_t> truncated(bytes.begin(), bytes.end() - 3);
  CHECK_FALSE(decode_records(truncated, &got, &out, &err));
  CHECK(err.find("corrupt record 1") != std::string::npos);
}

TEST_CASE("checksum changes with any byte", "[codec]") {
  std::vector<std::uint8_t> data(64, 0x11);
  const auto a = checksum32(data.data(), data.size());
  data[40] ^= 1;
  CHECK(checksum32(data.data(), data.size()) != a);
}
