#include "command_line_parser.hpp"
#include "file_handler.hpp"
#include "http_message.hpp"
#include "log.hpp"
#include "mime_types.hpp"
#include "multipart.hpp"
#include "path_guard.hpp"
#include "portal.hpp"
#include "qr_code.hpp"
#include "settings_manager.hpp"
#include "test_runner_utils.hpp"
#include "text_handler.hpp"
#include "text_slot.hpp"
#include "upload_store.hpp"
#include "utils.hpp"

#include <algorithm>
#include <atomic>
#include <cstdlib>
#include <filesystem>
#include <functional>
#include <iostream>
#include <random>
#include <set>
#include <sstream>
#include <thread>
#include <vector>

using laport::test::expect;
using laport::test::expect_eq;

namespace {

namespace fs = std::filesystem;

struct TestContext {
  laport::test::LogCapture& logs;
  bool verbose = false;
};

struct TestCase {
  std::string name;
  std::function<bool(TestContext&)> fn;
};

template<typename Fn>
int http_status_of(Fn&& fn) {
  try {
    fn();
  } catch(const HttpError& e) {
    return e.status();
  }
  return 0;
}

bool test_path_guard_rejects_escapes(TestContext&) {
  laport::test::TempDir dir;
  fs::create_directories(dir.path() / "a" / "b");
  laport::test::write_file(dir.path() / "a" / "b" / "c.txt", "c");
  fs::create_directory_symlink(dir.path().parent_path(), dir.path() / "outside");

  PathGuard guard(dir.path());
  auto root = fs::canonical(dir.path());

  expect(!guard.resolve("../etc/passwd"), "parent escape");
  expect(!guard.resolve("../../etc/passwd"), "double parent escape");
  expect(!guard.resolve("a/../../x"), "escape through a subdirectory");
  expect(!guard.resolve("/etc/passwd"), "absolute path");
  expect(!guard.resolve("a//b"), "empty segment");
  expect(!guard.resolve(std::string("a\0b", 3)), "NUL byte");
  expect(!guard.resolve("outside/x"), "symlink leaving the root");

  auto same = guard.resolve("");
  expect(same && *same == root, "empty path names the root");
  auto nested = guard.resolve("a/./b/../b/c.txt");
  expect(nested && *nested == root / "a" / "b" / "c.txt", "dot segments are normalized");
  auto missing = guard.resolve("a/new.txt");
  expect(missing && *missing == root / "a" / "new.txt", "missing leaf still resolves");
  return true;
}

bool test_path_guard_random_paths_stay_inside(TestContext&) {
  laport::test::TempDir dir;
  fs::create_directories(dir.path() / "x" / "y");
  fs::create_directory_symlink(dir.path().parent_path(), dir.path() / "x" / "up");
  PathGuard guard(dir.path());

  const std::vector<std::string> segments = {"x", "y", "up", "..", ".", "", "z.txt", "%2e%2e", "...", "x y"};
  std::mt19937 rng(1234);
  std::uniform_int_distribution<std::size_t> pick(0, segments.size() - 1);
  std::uniform_int_distribution<int> length(1, 6);

  for(int round = 0; round < 2000; ++round) {
    std::string path;
    int n = length(rng);
    for(int i = 0; i < n; ++i) {
      if(i > 0) path += '/';
      path += segments[pick(rng)];
    }
    auto resolved = guard.resolve(path);
    if(resolved) {
      expect(PathGuard::is_within(guard.root(), *resolved), "escaped with '" + path + "'");
    }
  }
  return true;
}

bool test_text_slot_single_winner(TestContext&) {
  TextSlot slot;
  constexpr int kThreads = 16;
  std::atomic<int> winners{0};
  std::atomic<int> winner_index{-1};
  std::atomic<bool> go{false};
  std::vector<std::thread> threads;
  for(int i = 0; i < kThreads; ++i) {
    threads.emplace_back([&, i]() {
      while(!go.load()) std::this_thread::yield();
      if(slot.try_fill("text-" + std::to_string(i))) {
        winners.fetch_add(1);
        winner_index.store(i);
      }
    });
  }
  go.store(true);
  for(auto& t : threads) t.join();

  expect_eq(winners.load(), 1, "exactly one fill succeeds");
  auto value = slot.value();
  expect(value.has_value(), "slot holds a value");
  expect_eq(*value, "text-" + std::to_string(winner_index.load()), "stored text belongs to the winner");
  expect(!slot.try_fill("late"), "filled slot refuses");
  expect_eq(*slot.value(), "text-" + std::to_string(winner_index.load()), "refused fill leaves the text");
  return true;
}

bool test_text_slot_wait_for(TestContext&) {
  TextSlot slot;
  expect(!slot.wait_for(std::chrono::milliseconds(20)), "empty slot times out");

  std::thread filler([&]() {
    std::this_thread::sleep_for(std::chrono::milliseconds(50));
    slot.try_fill(std::string("raw \xff bytes"));
  });
  auto value = slot.wait_for(std::chrono::seconds(5));
  filler.join();
  expect(value.has_value(), "wait_for sees the fill");
  expect_eq(*value, std::string("raw \xff bytes"), "bytes kept as received");
  expect(slot.filled(), "filled() reports true");
  return true;
}

class CollectingHandler : public MultipartParser::Handler {
public:
  struct Part {
    MultipartPartHeaders headers;
    std::string data;
  };

  void on_part_begin(const MultipartPartHeaders& headers) override {
    parts.push_back({headers, std::string()});
  }
  void on_part_data(const char* data, std::size_t size) override {
    parts.back().data.append(data, size);
  }
  void on_part_end() override {
    ++ended;
  }

  std::vector<Part> parts;
  int ended = 0;
};

bool test_multipart_any_chunking(TestContext&) {
  const std::string boundary = "XyZ123";
  // content that repeatedly looks like the start of a delimiter
  std::string tricky = "line\r\n-\r\n--XyZ12\r\n--XyZ\r\nend";
  std::string binary;
  for(int i = 0; i < 300; ++i) binary.push_back(static_cast<char>(i % 256));

  auto body = laport::test::build_multipart(boundary, {
    {"text", std::nullopt, "hello", ""},
    {"file", std::string("a; b.bin"), tricky, "application/octet-stream"},
    {"file", std::string("data.bin"), binary, ""},
  });
  body = "preamble to ignore\r\n" + body;

  for(std::size_t chunk : {std::size_t(1), std::size_t(2), std::size_t(7), std::size_t(64), body.size()}) {
    CollectingHandler handler;
    MultipartParser parser(boundary, handler);
    for(std::size_t offset = 0; offset < body.size(); offset += chunk) {
      parser.feed(body.data() + offset, std::min(chunk, body.size() - offset));
    }
    parser.finish();
    std::string label = "chunk " + std::to_string(chunk);
    expect(parser.done(), label + ": closing boundary seen");
    expect_eq(handler.parts.size(), std::size_t(3), label + ": part count");
    expect_eq(handler.ended, 3, label + ": every part ended");
    expect_eq(handler.parts[0].headers.name, "text", label + ": field name");
    expect(!handler.parts[0].headers.filename, label + ": plain field has no filename");
    expect_eq(handler.parts[0].data, "hello", label + ": field value");
    expect_eq(*handler.parts[1].headers.filename, "a; b.bin", label + ": quoted filename");
    expect_eq(handler.parts[1].headers.content_type, "application/octet-stream", label + ": part type");
    expect(handler.parts[1].data == tricky, label + ": near-delimiter bytes survive");
    expect(handler.parts[2].data == binary, label + ": binary bytes survive");
  }
  return true;
}

bool test_multipart_rejects_truncation(TestContext&) {
  const std::string boundary = "bnd";
  auto body = laport::test::build_multipart(boundary, {{"file", std::string("a.txt"), "abc", ""}});
  auto truncated = body.substr(0, body.find("--bnd--"));

  CollectingHandler handler;
  MultipartParser parser(boundary, handler);
  parser.feed(truncated.data(), truncated.size());
  expect_eq(http_status_of([&]{ parser.finish(); }), 400, "missing closing boundary");

  CollectingHandler other;
  MultipartParser no_disposition(boundary, other);
  std::string bad = "--bnd\r\nContent-Type: text/plain\r\n\r\nx\r\n--bnd--\r\n";
  expect_eq(http_status_of([&]{ no_disposition.feed(bad.data(), bad.size()); }), 400, "part without disposition");

  expect_eq(http_status_of([&]{ MultipartParser(std::string(71, 'b'), other); }), 400, "boundary too long");
  return true;
}

bool test_parse_request_head(TestContext&) {
  auto request = parse_request_head(
    "POST /up/a%20b.txt?x=1 HTTP/1.1\r\n"
    "Host: example\r\n"
    "content-length:  42 \r\n"
    "Expect: 100-continue\r\n"
    "Accept: application/json, text/html;q=0.5\r\n"
    "\r\n");
  expect_eq(request.method, "POST", "method");
  expect_eq(request.path, "/up/a%20b.txt", "path keeps escapes");
  expect_eq(request.query, "x=1", "query split off");
  expect_eq(request.header("CONTENT-LENGTH"), "42", "case-insensitive header lookup");
  expect(request.content_length() == std::optional<std::uint64_t>(42), "content length");
  expect(request.expects_continue(), "expect 100-continue");
  expect(request.wants_json(), "json preferred");

  expect_eq(http_status_of([]{ parse_request_head("GET / HTTP/2.0\r\n\r\n"); }), 505, "unsupported version");
  expect_eq(http_status_of([]{ parse_request_head("GARBAGE\r\n\r\n"); }), 400, "malformed request line");
  expect_eq(http_status_of([]{ parse_request_head("GET http://x/ HTTP/1.1\r\n\r\n"); }), 400, "absolute-form target");
  expect_eq(http_status_of([]{ parse_request_head("GET / HTTP/1.1\r\nNoColon\r\n\r\n"); }), 400, "header without colon");

  auto bad_length = parse_request_head("PUT /a HTTP/1.1\r\nContent-Length: 12abc\r\n\r\n");
  expect_eq(http_status_of([&]{ bad_length.content_length(); }), 400, "malformed Content-Length");
  auto no_length = parse_request_head("PUT /a HTTP/1.0\r\n\r\n");
  expect(!no_length.content_length(), "absent Content-Length");
  return true;
}

bool test_percent_and_form_decoding(TestContext&) {
  expect_eq(*percent_decode("a%20b%2Fc"), "a b/c", "escapes decoded");
  expect_eq(*percent_decode("a+b"), "a+b", "plus kept in paths");
  expect(!percent_decode("%zz"), "non-hex escape");
  expect(!percent_decode("abc%4"), "truncated escape");
  expect_eq(*percent_decode("%00"), std::string(1, '\0'), "NUL decoded for the caller to reject");
  expect_eq(percent_encode_path("dir/a b+é.txt"), "dir/a%20b%2B%C3%A9.txt", "path encoding");

  auto fields = parse_form_urlencoded("text=hello+world%21&other=1&text=second");
  expect_eq(fields.at("text"), "hello world!", "first text field wins");
  expect_eq(fields.at("other"), "1", "other field");
  expect_eq(http_status_of([]{ parse_form_urlencoded("text=%G1"); }), 400, "bad form escape");

  auto filename = header_parameter("form-data; name=\"file\"; filename=\"x; y.txt\"", "filename");
  expect(filename && *filename == "x; y.txt", "quoted parameter with separator");
  auto quoted = header_parameter("form-data; filename=\"say \\\"hi\\\".txt\"", "filename");
  expect(quoted && *quoted == "say \"hi\".txt", "escaped quote");
  expect_eq(media_type("Multipart/Form-Data; boundary=abc"), "multipart/form-data", "media type lowercased");
  return true;
}

bool test_mime_types(TestContext&) {
  expect_eq(mime_type_for("photo.JPG"), "image/jpeg", "uppercase extension");
  expect_eq(mime_type_for("/a/b/notes.txt"), "text/plain; charset=utf-8", "text file");
  expect_eq(mime_type_for("movie.mp4"), "video/mp4", "video");
  expect_eq(mime_type_for("archive.unknownext"), "application/octet-stream", "unknown extension");
  expect_eq(mime_type_for("Makefile"), "application/octet-stream", "no extension");
  return true;
}

bool test_content_disposition(TestContext&) {
  expect_eq(content_disposition("attachment", "report.pdf"), "attachment; filename=\"report.pdf\"", "ascii name");
  auto unicode = content_disposition("inline", "résumé \"v2\".pdf");
  expect(unicode.find("filename=\"r__sum__ _v2_.pdf\"") != std::string::npos, "ascii fallback");
  expect(unicode.find("filename*=UTF-8''r%C3%A9sum%C3%A9%20%22v2%22.pdf") != std::string::npos, "RFC 5987 name");
  return true;
}

bool test_upload_store_concurrent_commits(TestContext&) {
  laport::test::TempDir dir;
  UploadStore store(fs::canonical(dir.path()), nullptr);
  constexpr int kUploads = 8;

  std::vector<StoredUpload> results(kUploads);
  std::atomic<bool> go{false};
  std::vector<std::thread> threads;
  for(int i = 0; i < kUploads; ++i) {
    threads.emplace_back([&, i]() {
      auto staged = store.stage();
      std::string content = "upload number " + std::to_string(i);
      staged->write(content.data(), content.size());
      while(!go.load()) std::this_thread::yield();
      results[i] = store.commit(*staged, "photo.jpg");
    });
  }
  go.store(true);
  for(auto& t : threads) t.join();

  std::set<std::string> names;
  for(int i = 0; i < kUploads; ++i) {
    names.insert(results[i].name);
    std::string content = "upload number " + std::to_string(i);
    expect_eq(laport::test::read_file(results[i].path), content, "stored bytes for upload " + std::to_string(i));
    expect_eq(results[i].sha256, sha256_hex(content), "digest for upload " + std::to_string(i));
  }
  expect_eq(names.size(), std::size_t(kUploads), "distinct names");
  expect(names.count("photo.jpg") == 1, "first upload keeps its name");
  for(int i = 1; i < kUploads; ++i) {
    expect(names.count("photo_" + std::to_string(i) + ".jpg") == 1, "suffix " + std::to_string(i));
  }
  auto staging = dir.path() / UploadStore::kStagingDirName;
  expect(!fs::exists(staging) || fs::is_empty(staging), "no staging files left");
  return true;
}

bool test_upload_store_never_overwrites(TestContext&) {
  laport::test::TempDir dir;
  laport::test::write_file(dir.path() / "notes", "original");
  UploadStore store(fs::canonical(dir.path()), nullptr);

  auto staged = store.stage();
  staged->write("new", 3);
  auto stored = store.commit(*staged, "notes");
  expect_eq(stored.name, "notes_1", "taken name gets a suffix");
  expect_eq(laport::test::read_file(dir.path() / "notes"), "original", "existing file untouched");

  expect_eq(UploadStore::candidate_name("photo.jpg", 2), "photo_2.jpg", "suffix before extension");
  expect_eq(UploadStore::candidate_name("archive.tar.gz", 1), "archive.tar_1.gz", "last extension only");
  return true;
}

bool test_upload_store_discards_partial(TestContext&) {
  laport::test::TempDir dir;
  UploadStore store(fs::canonical(dir.path()), nullptr);
  fs::path staged_path;
  {
    auto staged = store.stage();
    staged_path = staged->path();
    staged->write("partial", 7);
    expect(fs::exists(staged_path), "staging file exists while writing");
  }
  expect(!fs::exists(staged_path), "abandoned staging file removed");
  for(const auto& entry : fs::directory_iterator(dir.path())) {
    expect(UploadStore::is_internal_name(entry.path().filename().string()), "nothing visible in the root");
  }
  return true;
}

bool test_upload_name_validation(TestContext&) {
  laport::test::TempDir dir;
  fs::create_directory(dir.path() / "sub");
  DirectoryHandler handler(dir.path(), "/", 0, nullptr);

  expect_eq(handler.validate_upload_name("photo.jpg"), "photo.jpg", "plain name");
  expect_eq(handler.validate_upload_name("C:\\Users\\me\\photo.jpg"), "photo.jpg", "windows client path");
  expect_eq(handler.validate_upload_name("./a.txt"), "a.txt", "dot prefix");
  expect_eq(http_status_of([&]{ handler.validate_upload_name(""); }), 400, "empty name");
  expect_eq(http_status_of([&]{ handler.validate_upload_name(".."); }), 400, "dot-dot");
  expect_eq(http_status_of([&]{ handler.validate_upload_name("../../etc/passwd"); }), 403, "escape");
  expect_eq(http_status_of([&]{ handler.validate_upload_name("sub/a.txt"); }), 403, "subdirectory");
  expect_eq(http_status_of([&]{ handler.validate_upload_name("/etc/passwd"); }), 403, "absolute");
  expect_eq(http_status_of([&]{ handler.validate_upload_name(".laport_tmp"); }), 403, "staging directory");
  return true;
}

bool test_client_path_through_multipart(TestContext&) {
  laport::test::TempDir dir;
  DirectoryHandler directory(dir.path(), "/", 0, nullptr);
  auto body = laport::test::build_multipart("cp", {{"file", std::string("C:\\Users\\me\\photo.jpg"), "x", ""}});

  CollectingHandler handler;
  MultipartParser parser("cp", handler);
  parser.feed(body.data(), body.size());
  parser.finish();
  expect_eq(handler.parts.size(), std::size_t(1), "one part");
  expect_eq(*handler.parts[0].headers.filename, "C:\\Users\\me\\photo.jpg", "backslashes kept literally");
  expect_eq(directory.validate_upload_name(*handler.parts[0].headers.filename), "photo.jpg", "reduced to the base name");
  return true;
}

bool test_extract_text(TestContext&) {
  auto body = laport::test::build_multipart("b0", {
    {"note", std::nullopt, "ignored", ""},
    {"text", std::nullopt, "secret\r\nline two", ""},
  });
  expect_eq(ReceiveTextHandler::extract_text("multipart/form-data; boundary=b0", body),
            "secret\r\nline two", "multipart text field");
  expect_eq(ReceiveTextHandler::extract_text("application/x-www-form-urlencoded", "text=a%26b+c"),
            "a&b c", "urlencoded text field");
  expect_eq(ReceiveTextHandler::extract_text("text/plain", "raw body"), "raw body", "raw body");
  expect_eq(ReceiveTextHandler::extract_text("", ""), "", "empty body is empty text");
  expect_eq(http_status_of([]{ ReceiveTextHandler::extract_text("application/x-www-form-urlencoded", "other=1"); }),
            400, "form without text");
  return true;
}

bool test_settings_and_command_line(TestContext&) {
  SettingsManager settings;
  CommandLineParser parser("laport");
  parser.parse(std::vector<std::string>{"-d", "/srv/drop", "--port", "8080", "--random-path",
                                        "--max-upload-bytes=1024", "-w", "2"}, settings);
  expect_eq(settings.get<std::string>("recv_file"), "/srv/drop", "alias -d");
  expect_eq(settings.get<int>("port"), 8080, "port");
  expect(settings.get<bool>("random_path"), "bool flag without value");
  expect_eq(settings.get<std::uint64_t>("max_upload_bytes"), std::uint64_t(1024), "inline value");

  std::istringstream no_stdin;
  auto config = make_portal_config(settings, no_stdin);
  expect(config.mode == PortalMode::Directory, "directory mode");
  expect_eq(config.listen_port, uint16_t(8080), "config port");
  expect_eq(config.base_path.size(), std::size_t(5), "random path is '/' plus four characters");
  expect_eq(config.workers, std::size_t(2), "workers");
  expect(!config.once, "once off by default");

  SettingsManager defaults;
  std::istringstream no_text;
  std::string error;
  expect(defaults.set_from_string("send_text", "x", error), "send_text set");
  expect_eq(make_portal_config(defaults, no_text).base_path, "/", "fixed path unless asked for a random one");
  bool documented = false;
  for(const auto& entry : SETTINGS_SPECIFICATION) {
    if(entry.at("key") == "path") {
      documented = entry.at("description").get<std::string>().find("--random-path") != std::string::npos;
    }
  }
  expect(documented, "usage of --path points at --random-path");

  bool threw = false;
  try {
    parser.parse(std::vector<std::string>{"--no-such-option"}, settings);
  } catch(const UsageError&) {
    threw = true;
  }
  expect(threw, "unknown option rejected");

  threw = false;
  try {
    parser.parse(std::vector<std::string>{"--port"}, settings);
  } catch(const UsageError&) {
    threw = true;
  }
  expect(threw, "missing value rejected");
  return true;
}

bool test_portal_config_modes(TestContext&) {
  CommandLineParser parser("laport");
  {
    SettingsManager settings;
    parser.parse(std::vector<std::string>{"-t", "-"}, settings);
    std::istringstream in("piped\ntext");
    auto config = make_portal_config(settings, in);
    expect(config.mode == PortalMode::SendText, "send text");
    expect_eq(config.text, "piped\ntext", "text read from the stream");
    expect_eq(config.base_path, "/", "default path");
  }
  {
    SettingsManager settings;
    parser.parse(std::vector<std::string>{"-t", ""}, settings);
    std::istringstream in;
    auto config = make_portal_config(settings, in);
    expect(config.mode == PortalMode::SendText, "empty text still selects send text");
    expect(config.text.empty(), "empty text shared as is");
  }
  {
    SettingsManager settings;
    parser.parse(std::vector<std::string>{"-p", "--path", "drop/"}, settings);
    std::istringstream in;
    auto config = make_portal_config(settings, in);
    expect(config.mode == PortalMode::ReceiveText, "receive text");
    expect(config.once, "receive text is single-shot");
    expect_eq(config.base_path, "/drop", "path normalized");
  }
  {
    SettingsManager settings;
    parser.parse(std::vector<std::string>{"-f", "a.txt", "-p"}, settings);
    std::istringstream in;
    bool threw = false;
    try {
      make_portal_config(settings, in);
    } catch(const StartupError&) {
      threw = true;
    }
    expect(threw, "two modes rejected");
  }
  {
    SettingsManager settings;
    std::istringstream in;
    bool threw = false;
    try {
      make_portal_config(settings, in);
    } catch(const StartupError&) {
      threw = true;
    }
    expect(threw, "no mode rejected");
  }
  {
    PortalConfig config;
    config.mode = PortalMode::SingleFile;
    config.payload_path = "/nonexistent/laport/file.bin";
    bool threw = false;
    try {
      validate_payload(config);
    } catch(const StartupError&) {
      threw = true;
    }
    expect(threw, "missing file is a startup error");
  }
  return true;
}

bool test_settings_file_then_command_line(TestContext&) {
  laport::test::TempDir dir;
  auto file = dir.path() / "laport.json";
  laport::test::write_file(file, R"({"port": 9000, "workers": 3, "send-text": "from file", "unknown": 1})");

  SettingsManager settings;
  expect(settings.load_from_file(file), "settings file loads");
  CommandLineParser parser("laport");
  parser.parse(std::vector<std::string>{"--port", "9100"}, settings);
  expect_eq(settings.get<int>("port"), 9100, "command line wins");
  expect_eq(settings.get<int>("workers"), 3, "file value kept");
  expect_eq(settings.get<std::string>("send_text"), "from file", "dashed key accepted");

  laport::test::write_file(file, "{ not json");
  expect(!settings.load_from_file(file), "malformed file reported");
  return true;
}

bool test_sha256_stream(TestContext&) {
  Sha256Stream digest;
  digest.update("ab", 2);
  digest.update("c", 1);
  expect_eq(digest.finish_hex(),
            "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad", "sha256(abc)");
  expect_eq(sha256_hex(""), "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855", "sha256 of nothing");
  auto token = random_token(32);
  expect_eq(token.size(), std::size_t(32), "token length");
  expect(token.find_first_not_of("0123456789abcdefghijklmnopqrstuvwxyz") == std::string::npos, "token alphabet");
  return true;
}

bool test_qr_code_rendering(TestContext&) {
  auto qr = render_qr_code("http://192.168.1.20:8000/k3x9");
  // built without libqrencode
  if(!qr) return true;

  std::vector<std::size_t> widths;
  std::istringstream lines(*qr);
  std::string line;
  while(std::getline(lines, line)) {
    // count code points, not bytes
    widths.push_back(static_cast<std::size_t>(std::count_if(line.begin(), line.end(), [](char c) {
      return (static_cast<unsigned char>(c) & 0xC0) != 0x80;
    })));
  }
  expect(!widths.empty(), "rendered lines");
  std::size_t modules = widths.front();
  expect(modules >= 23, "version 1 plus quiet zone at least");
  for(auto w : widths) expect_eq(w, modules, "square rendering");
  expect_eq(widths.size(), (modules + 1) / 2, "two module rows per line");
  expect(qr->find("█") != std::string::npos, "light modules drawn");
  return true;
}

} // namespace

int main(int argc, char** argv) {
  bool verbose = (std::getenv("LAPORT_TEST_VERBOSE") != nullptr);
  for(int i = 1; i < argc; ++i) {
    std::string arg = argv[i];
    if(arg == "-v" || arg == "--verbose") {
      verbose = true;
    }
  }

  bool show_logs = (std::getenv("LAPORT_TEST_LOGS") != nullptr) || verbose;
  const bool suppress_logs = !show_logs;
  if(suppress_logs) {
    set_log_passthrough(false);
  }
  laport::test::LogCapture logs;
  TestContext ctx{logs, verbose};
  std::vector<TestCase> tests = {
    {"path_guard_rejects_escapes", test_path_guard_rejects_escapes},
    {"path_guard_random_paths_stay_inside", test_path_guard_random_paths_stay_inside},
    {"text_slot_single_winner", test_text_slot_single_winner},
    {"text_slot_wait_for", test_text_slot_wait_for},
    {"multipart_any_chunking", test_multipart_any_chunking},
    {"multipart_rejects_truncation", test_multipart_rejects_truncation},
    {"parse_request_head", test_parse_request_head},
    {"percent_and_form_decoding", test_percent_and_form_decoding},
    {"mime_types", test_mime_types},
    {"content_disposition", test_content_disposition},
    {"upload_store_concurrent_commits", test_upload_store_concurrent_commits},
    {"upload_store_never_overwrites", test_upload_store_never_overwrites},
    {"upload_store_discards_partial", test_upload_store_discards_partial},
    {"upload_name_validation", test_upload_name_validation},
    {"client_path_through_multipart", test_client_path_through_multipart},
    {"extract_text", test_extract_text},
    {"settings_and_command_line", test_settings_and_command_line},
    {"portal_config_modes", test_portal_config_modes},
    {"settings_file_then_command_line", test_settings_file_then_command_line},
    {"sha256_stream", test_sha256_stream},
    {"qr_code_rendering", test_qr_code_rendering},
  };

  std::size_t failures = 0;
  std::cout << "Running " << tests.size() << " unit tests: " << std::flush;

  for(std::size_t idx = 0; idx < tests.size(); ++idx) {
    const auto& test = tests[idx];
    logs.clear();
    bool passed = false;
    try {
      passed = test.fn(ctx);
    } catch(const std::exception& e) {
      passed = false;
      std::cerr << "Exception in test " << test.name << ": " << e.what() << "\n";
    }
    if(passed) {
      std::cout << '.' << std::flush;
    } else {
      std::cout << 'F' << " (" << test.name << ")\n";
      failures++;
      for(const auto& line : logs.snapshot()) {
        std::cout << "    " << line << "\n";
      }
      if(idx + 1 < tests.size()) {
        std::cout << "Running " << tests.size() << " unit tests: " << std::flush;
      }
    }
  }
  std::cout << "\n";
  if(suppress_logs) {
    set_log_passthrough(true);
  }
  if(failures == 0) {
    std::cout << "PASS (" << tests.size() << " tests)\n";
    return 0;
  }
  std::cout << "FAIL (" << failures << "/" << tests.size() << " failed)\n";
  return 1;
}
