#include "csdat/LogTee.hpp"

#include <chrono>
#include <ctime>
#include <fstream>
#include <iostream>
#include <mutex>
#include <streambuf>
#include <string>
#include <system_error>

namespace csdat {

namespace {

std::filesystem::path RotatedPath(const std::filesystem::path& base, int idx)
{
  if (idx <= 0) return base;
  std::filesystem::path p = base;
  p += "." + std::to_string(idx);
  return p;
}

std::string UtcTimestamp()
{
  using namespace std::chrono;
  const auto now = system_clock::now();
  const auto ms = duration_cast<milliseconds>(now.time_since_epoch());
  const std::time_t tt = static_cast<std::time_t>(duration_cast<seconds>(ms).count());

  std::tm tm{};
#if defined(_WIN32)
  gmtime_s(&tm, &tt);
#else
  gmtime_r(&tt, &tm);
#endif

  char buf[32];
  const std::size_t n = std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%S", &tm);
  std::string out(buf, n);

  const int milli = static_cast<int>(ms.count() % 1000);
  out += '.';
  out += static_cast<char>('0' + milli / 100);
  out += static_cast<char>('0' + (milli / 10) % 10);
  out += static_cast<char>('0' + milli % 10);
  out += 'Z';
  return out;
}

// Shared by the stdout and stderr buffers so interleaved lines stay whole in the file.
struct FileSink {
  std::streambuf* file = nullptr;
  std::mutex mutex;
  bool atLineStart = true;
  bool prefixLines = true;
};

class TeeBuf final : public std::streambuf {
public:
  TeeBuf(std::streambuf* console, FileSink* sink, const char* tag) : m_console(console), m_sink(sink), m_tag(tag) {}

protected:
  int overflow(int ch) override
  {
    if (traits_type::eq_int_type(ch, traits_type::eof())) return traits_type::not_eof(ch);
    const char c = traits_type::to_char_type(ch);
    return xsputn(&c, 1) == 1 ? ch : traits_type::eof();
  }

  std::streamsize xsputn(const char* s, std::streamsize n) override
  {
    if (n <= 0) return 0;
    std::lock_guard<std::mutex> lock(m_sink->mutex);

    const std::streamsize consoleWritten = m_console->sputn(s, n);
    writeFileLocked(s, n);
    return consoleWritten;
  }

  int sync() override
  {
    std::lock_guard<std::mutex> lock(m_sink->mutex);
    const int a = m_console->pubsync();
    const int b = m_sink->file->pubsync();
    return (a == 0 && b == 0) ? 0 : -1;
  }

private:
  void writeFileLocked(const char* s, std::streamsize n)
  {
    std::streambuf* f = m_sink->file;
    if (!m_sink->prefixLines) {
      f->sputn(s, n);
      return;
    }

    std::streamsize pos = 0;
    while (pos < n) {
      if (m_sink->atLineStart) {
        const std::string prefix = UtcTimestamp() + " [" + m_tag + "] ";
        f->sputn(prefix.data(), static_cast<std::streamsize>(prefix.size()));
        m_sink->atLineStart = false;
      }

      std::streamsize end = pos;
      while (end < n && s[end] != '\n') ++end;
      const bool newline = end < n;
      if (newline) ++end;

      f->sputn(s + pos, end - pos);
      pos = end;

      if (newline) {
        m_sink->atLineStart = true;
        f->pubsync();
      }
    }
  }

  std::streambuf* m_console = nullptr;
  FileSink* m_sink = nullptr;
  std::string m_tag;
};

// One redirected standard stream. Restores the console buffer only if it is still ours.
struct Redirect {
  std::ostream* stream = nullptr;
  std::streambuf* console = nullptr;
  std::unique_ptr<TeeBuf> tee;

  void install(std::ostream& os, FileSink* sink, const char* tag)
  {
    stream = &os;
    console = os.rdbuf();
    tee = std::make_unique<TeeBuf>(console, sink, tag);
    os.rdbuf(tee.get());
  }

  void restore()
  {
    if (stream && tee && stream->rdbuf() == tee.get()) stream->rdbuf(console);
    stream = nullptr;
  }
};

} // namespace

struct LogTee::Impl {
  std::filesystem::path path;
  std::ofstream file;
  FileSink sink;
  Redirect out;
  Redirect err;
};

LogTee::LogTee() = default;

LogTee::~LogTee()
{
  stop();
}

bool LogTee::active() const
{
  return m_impl != nullptr;
}

const std::filesystem::path& LogTee::path() const
{
  static const std::filesystem::path kNone;
  return m_impl ? m_impl->path : kNone;
}

bool LogTee::Rotate(const std::filesystem::path& basePath, int keepFiles, std::string& outError)
{
  outError.clear();
  if (keepFiles <= 0) return true;

  namespace fs = std::filesystem;
  std::error_code ec;
  for (int i = keepFiles; i >= 1; --i) {
    const fs::path src = RotatedPath(basePath, i - 1);
    if (!fs::exists(src, ec)) continue;

    const fs::path dst = RotatedPath(basePath, i);
    fs::remove(dst, ec);
    fs::rename(src, dst, ec);
    if (ec) {
      outError = "failed to rotate log '" + src.string() + "' -> '" + dst.string() + "': " + ec.message();
      return false;
    }
  }
  return true;
}

bool LogTee::start(const LogTeeOptions& opt, std::string& outError)
{
  outError.clear();
  stop();

  if (opt.path.empty()) {
    outError = "log path is empty";
    return false;
  }

  const std::filesystem::path parent = opt.path.parent_path();
  if (!parent.empty()) {
    std::error_code ec;
    std::filesystem::create_directories(parent, ec);
    if (ec) {
      outError = "failed to create log directory '" + parent.string() + "': " + ec.message();
      return false;
    }
  }

  if (!Rotate(opt.path, opt.keepFiles, outError)) return false;

  auto impl = std::make_unique<Impl>();
  impl->path = opt.path;
  impl->file.open(opt.path, std::ios::out | std::ios::binary | std::ios::trunc);
  if (!impl->file) {
    outError = "unable to open log file for writing: " + opt.path.string();
    return false;
  }
  impl->sink.file = impl->file.rdbuf();
  impl->sink.prefixLines = opt.prefixLines;

  if (opt.teeStdout) impl->out.install(std::cout, &impl->sink, "OUT");
  if (opt.teeStderr) impl->err.install(std::cerr, &impl->sink, "ERR");

  m_impl = std::move(impl);
  return true;
}

void LogTee::stop()
{
  if (!m_impl) return;

  // Restore first so output during teardown never reaches a closed file.
  m_impl->out.restore();
  m_impl->err.restore();

  m_impl->file.flush();
  m_impl.reset();
}

} // namespace csdat
