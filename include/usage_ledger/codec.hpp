#pragma once

#include "usage_ledger/contribution.hpp"
#include "usage_ledger/model_interner.hpp"
#include "usage_ledger/types.hpp"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace usage_ledger {

// Little-endian binary writer used by the hot archive and the record store.
class ByteWriter {
public:
  void put_u8(std::uint8_t v) { buf_.push_back(v); }
  void put_u16(std::uint16_t v);
  void put_u32(std::uint32_t v);
  void put_u64(std::uint64_t v);
  void put_i64(std::int64_t v) { put_u64(static_cast<std::uint64_t>(v)); }
  void put_f64(double v);
  void put_string(const std::string &s);
  void put_opt_string(const std::optional<std::string> &s);
  void put_bytes(const std::uint8_t *p, std::size_t n);

  const std::vector<std::uint8_t> &data() const { return buf_; }
  std::vector<std::uint8_t> take() { return std::move(buf_); }
  std::size_t size() const { return buf_.size(); }

private:
  std::vector<std::uint8_t> buf_;
};

// Bounds-checked reader; every getter returns false once the input runs out.
class ByteReader {
public:
  ByteReader(const std::uint8_t *data, std::size_t size)
      : data_(data), size_(size) {}

  bool get_u8(std::uint8_t *v);
  bool get_u16(std::uint16_t *v);
  bool get_u32(std::uint32_t *v);
  bool get_u64(std::uint64_t *v);
  bool get_i64(std::int64_t *v);
  bool get_f64(double *v);
  bool get_string(std::string *s);
  bool get_opt_string(std::optional<std::string> *s);

  std::size_t remaining() const { return size_ - pos_; }
  std::size_t position() const { return pos_; }

private:
  bool take(void *out, std::size_t n);

  const std::uint8_t *data_;
  std::size_t size_;
  std::size_t pos_{0};
};

// Maps process-local ModelKeys to dense indices of a persisted name table.
class ModelTable {
public:
  explicit ModelTable(const ModelInterner &interner) : interner_(interner) {}

  std::uint16_t index_of(ModelKey key);
  const std::vector<std::string> &names() const { return names_; }

private:
  const ModelInterner &interner_;
  std::unordered_map<std::uint16_t, std::uint16_t> index_;
  std::vector<std::string> names_;
};

void put_identity(ByteWriter &w, const FileIdentity &id);
bool get_identity(ByteReader &r, FileIdentity *id);

void put_message(ByteWriter &w, const Message &m);
bool get_message(ByteReader &r, Message *m);

// Cold payload: the identity the records were parsed from, then the records.
std::vector<std::uint8_t> encode_records(const FileIdentity &identity,
                                         const std::vector<Message> &records);
bool decode_records(const std::vector<std::uint8_t> &bytes,
                    FileIdentity *identity, std::vector<Message> *out,
                    std::string *err = nullptr);

void put_contribution(ByteWriter &w, const Contribution &c, ModelTable &models);
// remap translates persisted model indices into this process's keys.
bool get_contribution(ByteReader &r, const std::vector<ModelKey> &remap,
                      Contribution *c);

std::uint32_t checksum32(const std::uint8_t *data, std::size_t n);

} // namespace usage_ledger
