#include "fwf/record_reader.hpp"
#include <cerrno>
#include <cstdio>
#include <cstring>
#include <string_view>
#include <vector>

namespace fwf {

static bool is_eol(char c) { return c == '\n' || c == '\r'; }

struct RecordReader::Impl {
  const FileLayout& layout;
  Config cfg;
  DecodePolicy policy;
  std::vector<std::string> names;

  std::FILE* f{nullptr};
  State state{State::Unopened};
  int tw{-1};

  std::vector<char> buf;
  std::size_t pos{0};
  std::size_t end{0};
  bool eof{false};

  std::uint64_t line{0};
  std::uint64_t good{0};
  std::uint64_t bad{0};
  std::uint64_t bad_fields{0};
  std::uint64_t bytes{0};

  Impl(const FileLayout& l, Config c) : layout(l), cfg(std::move(c)), names(l.column_names()) {
    policy.trim_text = cfg.trim_text;
    if (cfg.chunk_records == 0) throw InvalidSpecError("chunk_records must be > 0");
    if (cfg.max_field_failures < 0) throw InvalidSpecError("max_field_failures must be >= 0");
  }

  LogSink& log() { return cfg.log ? *cfg.log : default_sink(); }

  std::size_t rlen() const { return static_cast<std::size_t>(layout.record_length()); }
  std::size_t stride() const { return rlen() + static_cast<std::size_t>(tw < 0 ? 0 : tw); }

  // Reads one record-length block, then counts the CR/LF bytes after it.
  void sniff_terminator() {
    std::vector<char> first(rlen());
    tw = 0;
    if (std::fread(first.data(), 1, first.size(), f) == first.size()) {
      int c;
      while (tw < 2 && (c = std::fgetc(f)) != EOF && is_eol(static_cast<char>(c))) ++tw;
    }
    if (std::ferror(f)) throw IoError("read failed: " + layout.path(), errno);
    std::rewind(f);
    log().debug(layout.path() + ": terminator width " + std::to_string(tw));
  }

  void open() {
    if (state == State::Open) return;
    if (f) { std::fclose(f); f = nullptr; }
    f = std::fopen(layout.path().c_str(), "rb");
    if (!f) {
      int err = errno;
      throw IoError("cannot open " + layout.path() + ": " + std::strerror(err), err);
    }
    try {
      if (tw < 0) sniff_terminator();
    } catch (...) {
      std::fclose(f); f = nullptr;
      throw;
    }
    buf.assign(stride() * cfg.chunk_records, 0);
    pos = end = 0;
    eof = false;
    line = good = bad = bad_fields = bytes = 0;
    state = State::Open;
    (void)layout.validate(log(), tw);
  }

  void close() noexcept {
    if (f) { std::fclose(f); f = nullptr; }
    state = State::Closed;
  }

  // Moves the unread tail to the front and tops the buffer up with one read.
  void refill() {
    if (pos > 0) {
      std::memmove(buf.data(), buf.data() + pos, end - pos);
      end -= pos;
      pos = 0;
    }
    const std::size_t want = buf.size() - end;
    const std::size_t n = std::fread(buf.data() + end, 1, want, f);
    if (n < want) {
      if (std::ferror(f)) throw IoError("read failed: " + layout.path(), errno);
      eof = true;
    }
    end += n;
    bytes += n;
    if (cfg.metrics) cfg.metrics->add_bytes(n);
  }

  bool next_block(std::string_view& block) {
    if (end - pos < stride() && !eof) refill();
    if (end - pos < rlen()) {
      std::size_t left = end - pos;
      while (left > 0 && is_eol(buf[pos + left - 1])) --left;
      if (left > 0)
        log().warn(layout.path() + ": ignoring trailing partial record of " +
                   std::to_string(left) + " bytes");
      pos = end;
      return false;
    }
    block = std::string_view(buf.data() + pos, rlen());
    pos += rlen();
    while (pos < end && is_eol(buf[pos])) ++pos;
    return true;
  }

  Positional decode(std::string_view block) {
    const auto& cols = layout.columns();
    const auto& decoders = layout.decoders();
    Positional rec;
    rec.reserve(cols.size());
    int failures = 0;
    for (std::size_t i = 0; i < cols.size(); ++i) {
      const ColumnSpec& c = cols[i];
      std::string_view raw = block.substr(static_cast<std::size_t>(c.start()),
                                          static_cast<std::size_t>(c.length()));
      std::optional<Value> v;
      const bool utf8 = is_valid_utf8(raw);
      if (utf8) v = decoders[i](raw, policy);
      if (v) { rec.push_back(std::move(*v)); continue; }

      ++failures;
      ++bad_fields;
      if (cfg.metrics) cfg.metrics->add_field_error(c.name());
      const std::string text(trim(raw));
      log().warn(std::to_string(line) + ": " + c.name() + "[" + std::to_string(c.ord()) + "]: - " +
                 (utf8 ? "cannot parse '" + text + "' as " + std::string(type_name(c.type()))
                       : std::string("invalid UTF-8")));
      if (failures > cfg.max_field_failures) {
        log().error(std::string(block));
        throw StructuralParseError("Too many exceptions", c.start(), c.name());
      }
      rec.emplace_back(text);
    }
    return rec;
  }

  void shape(Record& out, Positional&& rec) const {
    if (cfg.shape == Shape::Positional) { out = std::move(rec); return; }
    Keyed m;
    m.reserve(rec.size());
    for (std::size_t i = 0; i < rec.size(); ++i) m.emplace(names[i], std::move(rec[i]));
    out = std::move(m);
  }

  bool read_next(Record& out) {
    if (state == State::Unopened) open();
    if (state != State::Open) return false;
    while (true) {
      std::string_view block;
      if (!next_block(block)) { state = State::Exhausted; return false; }
      ++line;
      try {
        Positional rec = decode(block);
        ++good;
        if (cfg.metrics) cfg.metrics->add_row();
        shape(out, std::move(rec));
        return true;
      } catch (const StructuralParseError& x) {
        ++bad;
        if (cfg.metrics) cfg.metrics->add_bad_row();
        log().error("Line = " + std::to_string(line) + ":" + std::to_string(x.pos()) +
                    " (" + x.column() + "): " + x.what());
        if (cfg.on_parse_failure) cfg.on_parse_failure(x, line);
      }
    }
  }
};

RecordReader::RecordReader(const FileLayout& layout)
  : RecordReader(layout, Config{}) {}

RecordReader::RecordReader(const FileLayout& layout, Config cfg)
  : p_(new Impl(layout, std::move(cfg))) {}

RecordReader::~RecordReader() { p_->close(); delete p_; }

void RecordReader::open() { p_->open(); }
void RecordReader::close() noexcept { p_->close(); }
bool RecordReader::read_next(Record& out) { return p_->read_next(out); }
Positional RecordReader::decode_record(std::string_view block) {
  if (block.size() < static_cast<std::size_t>(p_->layout.record_length()))
    throw StructuralParseError("short record: " + std::to_string(block.size()) + " bytes", 0, "");
  return p_->decode(block);
}

std::uint64_t RecordReader::for_each_record(const RecordCallback& cb) {
  Record r;
  std::uint64_t n = 0;
  while (read_next(r)) { cb(r); ++n; }
  return n;
}

RecordReader::State RecordReader::state() const noexcept { return p_->state; }
int RecordReader::terminator_width() const noexcept { return p_->tw; }
std::int64_t RecordReader::record_stride() const noexcept { return static_cast<std::int64_t>(p_->stride()); }
std::uint64_t RecordReader::good_lines() const noexcept { return p_->good; }
std::uint64_t RecordReader::bad_lines() const noexcept { return p_->bad; }
std::uint64_t RecordReader::bad_fields() const noexcept { return p_->bad_fields; }
std::uint64_t RecordReader::line() const noexcept { return p_->line; }
std::uint64_t RecordReader::bytes_read() const noexcept { return p_->bytes; }
const FileLayout& RecordReader::layout() const noexcept { return p_->layout; }
std::vector<std::string> RecordReader::column_names() const { return p_->names; }

}
