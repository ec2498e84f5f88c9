#include "usage_ledger/codec.hpp"

#include <cstring>
#include <type_traits>

namespace usage_ledger {
namespace {
constexpr std::uint8_t kNoModel = 0;
constexpr std::uint8_t kHasModel = 1;

void put_packed(ByteWriter &w, const PackedStats &p) {
  w.put_u32(p.input_tokens);
  w.put_u32(p.output_tokens);
  w.put_u32(p.reasoning_tokens);
  w.put_u32(p.cache_creation_tokens);
  w.put_u32(p.cache_read_tokens);
  w.put_u32(p.cached_tokens);
  w.put_u32(p.cost_units);
  w.put_u16(p.tool_calls);
}

bool get_packed(ByteReader &r, PackedStats *p) {
  return r.get_u32(&p->input_tokens) && r.get_u32(&p->output_tokens) &&
         r.get_u32(&p->reasoning_tokens) &&
         r.get_u32(&p->cache_creation_tokens) &&
         r.get_u32(&p->cache_read_tokens) && r.get_u32(&p->cached_tokens) &&
         r.get_u32(&p->cost_units) && r.get_u16(&p->tool_calls);
}

void put_models(ByteWriter &w, const ModelCounts &m, ModelTable &models) {
  w.put_u16(static_cast<std::uint16_t>(m.size()));
  for (const auto &[key, n] : m.items()) {
    w.put_u16(models.index_of(key));
    w.put_u32(n);
  }
}

bool get_models(ByteReader &r, const std::vector<ModelKey> &remap,
                ModelCounts *m) {
  std::uint16_t n = 0;
  if (!r.get_u16(&n))
    return false;
  for (std::uint16_t i = 0; i < n; ++i) {
    std::uint16_t idx = 0;
    std::uint32_t count = 0;
    if (!r.get_u16(&idx) || !r.get_u32(&count) || idx >= remap.size())
      return false;
    m->add(remap[idx], count);
  }
  return true;
}

void put_day(ByteWriter &w, const DayTally &d, ModelTable &models) {
  w.put_u32(d.date.packed);
  put_packed(w, d.stats);
  w.put_u32(d.user_messages);
  w.put_u32(d.ai_messages);
  put_models(w, d.models, models);
}

bool get_day(ByteReader &r, const std::vector<ModelKey> &remap, DayTally *d) {
  return r.get_u32(&d->date.packed) && get_packed(r, &d->stats) &&
         r.get_u32(&d->user_messages) && r.get_u32(&d->ai_messages) &&
         get_models(r, remap, &d->models);
}

void put_days(ByteWriter &w, const std::vector<DayTally> &days,
              ModelTable &models) {
  w.put_u32(static_cast<std::uint32_t>(days.size()));
  for (const auto &d : days)
    put_day(w, d, models);
}

bool get_days(ByteReader &r, const std::vector<ModelKey> &remap,
              std::vector<DayTally> *days) {
  std::uint32_t n = 0;
  if (!r.get_u32(&n))
    return false;
  days->clear();
  for (std::uint32_t i = 0; i < n; ++i) {
    DayTally d;
    if (!get_day(r, remap, &d))
      return false;
    days->push_back(std::move(d));
  }
  return true;
}

void put_model_key(ByteWriter &w, const std::optional<ModelKey> &key,
                   ModelTable &models) {
  if (!key) {
    w.put_u8(kNoModel);
    return;
  }
  w.put_u8(kHasModel);
  w.put_u16(models.index_of(*key));
}

bool get_model_key(ByteReader &r, const std::vector<ModelKey> &remap,
                   std::optional<ModelKey> *key) {
  std::uint8_t tag = 0;
  if (!r.get_u8(&tag))
    return false;
  if (tag == kNoModel) {
    key->reset();
    return true;
  }
  std::uint16_t idx = 0;
  if (tag != kHasModel || !r.get_u16(&idx) || idx >= remap.size())
    return false;
  *key = remap[idx];
  return true;
}
} // namespace

void ByteWriter::put_u16(std::uint16_t v) {
  put_u8(static_cast<std::uint8_t>(v));
  put_u8(static_cast<std::uint8_t>(v >> 8));
}

void ByteWriter::put_u32(std::uint32_t v) {
  for (int i = 0; i < 4; ++i)
    put_u8(static_cast<std::uint8_t>(v >> (8 * i)));
}

void ByteWriter::put_u64(std::uint64_t v) {
  for (int i = 0; i < 8; ++i)
    put_u8(static_cast<std::uint8_t>(v >> (8 * i)));
}

void ByteWriter::put_f64(double v) {
  std::uint64_t bits = 0;
  std::memcpy(&bits, &v, sizeof(bits));
  put_u64(bits);
}

void ByteWriter::put_string(const std::string &s) {
  put_u32(static_cast<std::uint32_t>(s.size()));
  put_bytes(reinterpret_cast<const std::uint8_t *>(s.data()), s.size());
}

void ByteWriter::put_opt_string(const std::optional<std::string> &s) {
  put_u8(s.has_value() ? 1 : 0);
  if (s)
    put_string(*s);
}

void ByteWriter::put_bytes(const std::uint8_t *p, std::size_t n) {
  buf_.insert(buf_.end(), p, p + n);
}

bool ByteReader::take(void *out, std::size_t n) {
  if (size_ - pos_ < n)
    return false;
  std::memcpy(out, data_ + pos_, n);
  pos_ += n;
  return true;
}

bool ByteReader::get_u8(std::uint8_t *v) { return take(v, 1); }

bool ByteReader::get_u16(std::uint16_t *v) {
  std::uint8_t b[2];
  if (!take(b, sizeof(b)))
    return false;
  *v = static_cast<std::uint16_t>(b[0] | (b[1] << 8));
  return true;
}

bool ByteReader::get_u32(std::uint32_t *v) {
  std::uint8_t b[4];
  if (!take(b, sizeof(b)))
    return false;
  *v = 0;
  for (int i = 3; i >= 0; --i)
    *v = (*v << 8) | b[i];
  return true;
}

bool ByteReader::get_u64(std::uint64_t *v) {
  std::uint8_t b[8];
  if (!take(b, sizeof(b)))
    return false;
  *v = 0;
  for (int i = 7; i >= 0; --i)
    *v = (*v << 8) | b[i];
  return true;
}

bool ByteReader::get_i64(std::int64_t *v) {
  std::uint64_t u = 0;
  if (!get_u64(&u))
    return false;
  *v = static_cast<std::int64_t>(u);
  return true;
}

bool ByteReader::get_f64(double *v) {
  std::uint64_t bits = 0;
  if (!get_u64(&bits))
    return false;
  std::memcpy(v, &bits, sizeof(bits));
  return true;
}

bool ByteReader::get_string(std::string *s) {
  std::uint32_t n = 0;
  if (!get_u32(&n) || remaining() < n)
    return false;
  s->assign(reinterpret_cast<const char *>(data_ + pos_), n);
  pos_ += n;
  return true;
}

bool ByteReader::get_opt_string(std::optional<std::string> *s) {
  std::uint8_t tag = 0;
  if (!get_u8(&tag) || tag > 1)
    return false;
  if (tag == 0) {
    s->reset();
    return true;
  }
  std::string v;
  if (!get_string(&v))
    return false;
  *s = std::move(v);
  return true;
}

std::uint16_t ModelTable::index_of(ModelKey key) {
  auto it = index_.find(key.value);
  if (it != index_.end())
    return it->second;
  const auto idx = static_cast<std::uint16_t>(names_.size());
  names_.push_back(interner_.resolve(key));
  index_.emplace(key.value, idx);
  return idx;
}

void put_identity(ByteWriter &w, const FileIdentity &id) {
  w.put_u64(id.size);
  w.put_i64(id.mtime_ns);
  w.put_u8(id.fingerprint.has_value() ? 1 : 0);
  if (id.fingerprint)
    w.put_u64(*id.fingerprint);
}

bool get_identity(ByteReader &r, FileIdentity *id) {
  std::uint8_t has_fp = 0;
  if (!r.get_u64(&id->size) || !r.get_i64(&id->mtime_ns) || !r.get_u8(&has_fp))
    return false;
  if (has_fp == 0) {
    id->fingerprint.reset();
    return true;
  }
  std::uint64_t fp = 0;
  if (has_fp != 1 || !r.get_u64(&fp))
    return false;
  id->fingerprint = fp;
  return true;
}

void put_message(ByteWriter &w, const Message &m) {
  w.put_string(m.application);
  w.put_i64(m.timestamp);
  w.put_string(m.project_hash);
  w.put_string(m.session_id);
  w.put_opt_string(m.local_hash);
  w.put_string(m.global_hash);
  w.put_opt_string(m.model);
  w.put_u8(static_cast<std::uint8_t>(m.role));
  w.put_u64(m.stats.input_tokens);
  w.put_u64(m.stats.output_tokens);
  w.put_u64(m.stats.reasoning_tokens);
  w.put_u64(m.stats.cache_creation_tokens);
  w.put_u64(m.stats.cache_read_tokens);
  w.put_u64(m.stats.cached_tokens);
  w.put_f64(m.stats.cost);
  w.put_u32(m.stats.tool_calls);
  w.put_opt_string(m.session_name);
  w.put_opt_string(m.uuid);
}

bool get_message(ByteReader &r, Message *m) {
  std::uint8_t role = 0;
  const bool ok =
      r.get_string(&m->application) && r.get_i64(&m->timestamp) &&
      r.get_string(&m->project_hash) && r.get_string(&m->session_id) &&
      r.get_opt_string(&m->local_hash) && r.get_string(&m->global_hash) &&
      r.get_opt_string(&m->model) && r.get_u8(&role) &&
      r.get_u64(&m->stats.input_tokens) && r.get_u64(&m->stats.output_tokens) &&
      r.get_u64(&m->stats.reasoning_tokens) &&
      r.get_u64(&m->stats.cache_creation_tokens) &&
      r.get_u64(&m->stats.cache_read_tokens) &&
      r.get_u64(&m->stats.cached_tokens) && r.get_f64(&m->stats.cost) &&
      r.get_u32(&m->stats.tool_calls) && r.get_opt_string(&m->session_name) &&
      r.get_opt_string(&m->uuid);
  if (!ok || role > 1)
    return false;
  m->role = static_cast<MessageRole>(role);
  return true;
}

std::vector<std::uint8_t> encode_records(const FileIdentity &identity,
                                         const std::vector<Message> &records) {
  ByteWriter w;
  put_identity(w, identity);
  w.put_u32(static_cast<std::uint32_t>(records.size()));
  for (const auto &m : records)
    put_message(w, m);
  return w.take();
}

bool decode_records(const std::vector<std::uint8_t> &bytes,
                    FileIdentity *identity, std::vector<Message> *out,
                    std::string *err) {
  ByteReader r(bytes.data(), bytes.size());
  std::uint32_t n = 0;
  if (!get_identity(r, identity) || !r.get_u32(&n)) {
    if (err)
      *err = "truncated record list";
    return false;
  }
  out->clear();
  out->reserve(n);
  for (std::uint32_t i = 0; i < n; ++i) {
    Message m;
    if (!get_message(r, &m)) {
      if (err)
        *err = "corrupt record " + std::to_string(i);
      return false;
    }
    out->push_back(std::move(m));
  }
  return true;
}

void put_contribution(ByteWriter &w, const Contribution &c,
                      ModelTable &models) {
  w.put_u8(static_cast<std::uint8_t>(c.index()));
  std::visit(
      [&](const auto &v) {
        using T = std::decay_t<decltype(v)>;
        if constexpr (std::is_same_v<T, SingleMessageContribution>) {
          w.put_u8(v.present ? 1 : 0);
          w.put_u32(v.date.packed);
          w.put_i64(v.timestamp);
          put_packed(w, v.stats);
          put_model_key(w, v.model, models);
          w.put_u8(v.ai ? 1 : 0);
          w.put_string(v.session_id);
          w.put_opt_string(v.session_name);
        } else if constexpr (std::is_same_v<T, SingleSessionContribution>) {
          w.put_string(v.session_id);
          w.put_opt_string(v.session_name);
          w.put_i64(v.first_timestamp);
          put_days(w, v.days, models);
        } else {
          w.put_u32(static_cast<std::uint32_t>(v.sessions.size()));
          for (const auto &s : v.sessions) {
            w.put_string(s.session_id);
            put_packed(w, s.stats);
            w.put_u32(s.user_messages);
            w.put_u32(s.ai_messages);
            put_models(w, s.models, models);
            w.put_i64(s.origin.first_timestamp);
            w.put_opt_string(s.origin.name);
          }
          put_days(w, v.days, models);
        }
      },
      c);
}

bool get_contribution(ByteReader &r, const std::vector<ModelKey> &remap,
                      Contribution *c) {
  std::uint8_t tag = 0;
  if (!r.get_u8(&tag))
    return false;
  switch (tag) {
  case 0: {
    SingleMessageContribution v;
    std::uint8_t present = 0, ai = 0;
    if (!r.get_u8(&present) || !r.get_u32(&v.date.packed) ||
        !r.get_i64(&v.timestamp) || !get_packed(r, &v.stats) ||
        !get_model_key(r, remap, &v.model) || !r.get_u8(&ai) ||
        !r.get_string(&v.session_id) || !r.get_opt_string(&v.session_name))
      return false;
    v.present = present != 0;
    v.ai = ai != 0;
    *c = std::move(v);
    return true;
  }
  case 1: {
    SingleSessionContribution v;
    if (!r.get_string(&v.session_id) || !r.get_opt_string(&v.session_name) ||
        !r.get_i64(&v.first_timestamp) || !get_days(r, remap, &v.days))
      return false;
    *c = std::move(v);
    return true;
  }
  case 2: {
    MultiSessionContribution v;
    std::uint32_t n = 0;
    if (!r.get_u32(&n))
      return false;
    for (std::uint32_t i = 0; i < n; ++i) {
      SessionTally s;
      if (!r.get_string(&s.session_id) || !get_packed(r, &s.stats) ||
          !r.get_u32(&s.user_messages) || !r.get_u32(&s.ai_messages) ||
          !get_models(r, remap, &s.models) ||
          !r.get_i64(&s.origin.first_timestamp) ||
          !r.get_opt_string(&s.origin.name))
        return false;
      v.sessions.push_back(std::move(s));
    }
    if (!get_days(r, remap, &v.days))
      return false;
    *c = std::move(v);
    return true;
  }
  default:
    return false;
  }
}

std::uint32_t checksum32(const std::uint8_t *data, std::size_t n) {
  std::uint32_t sum = 2166136261u;
  for (std::size_t i = 0; i < n; ++i) {
    sum ^= data[i];
    sum *= 16777619u;
  }
  return sum;
}

} // namespace usage_ledger
