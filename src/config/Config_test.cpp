#include "Config.hpp"

#include <gtest/gtest.h>
#include <sys/stat.h>
#include <unistd.h>

#include <cstdio>
#include <cstdlib>
#include <fstream>
#include <stdexcept>
#include <string>

#include "ConfigError.hpp"

static bool build(const std::string& text, ServerConfig& out,
                  const std::string& base = "/srv/site") {
  Config cfg;
  cfg.loadString(text);
  return cfg.buildServer(base, out);
}

static std::vector<std::string> args1(const std::string& a) {
  return std::vector<std::string>(1, a);
}

// Temporary directory removed (with its files) on destruction
class TempDir {
 public:
  TempDir() {
    char tmpl[] = "/tmp/ngxpreview_config_XXXXXX";
    char* p = mkdtemp(tmpl);
    path_ = p ? p : "";
  }

  ~TempDir() {
    for (size_t i = 0; i < files_.size(); ++i) {
      std::remove(files_[i].c_str());
    }
    for (size_t i = dirs_.size(); i > 0; --i) {
      rmdir(dirs_[i - 1].c_str());
    }
    rmdir(path_.c_str());
  }

  std::string mkdir(const std::string& name) {
    std::string full = path_ + "/" + name;
    ::mkdir(full.c_str(), 0755);
    dirs_.push_back(full);
    return full;
  }

  std::string write(const std::string& name, const std::string& content) {
    std::string full = path_ + "/" + name;
    std::ofstream ofs(full.c_str());
    ofs << content;
    ofs.close();
    files_.push_back(full);
    return full;
  }

  const std::string& path() const {
    return path_;
  }

 private:
  std::string path_;
  std::vector<std::string> files_;
  std::vector<std::string> dirs_;
};

// ==================== SERVER LOOKUP ====================

TEST(ConfigBasic, RoundTrip) {
  ServerConfig srv;
  ASSERT_TRUE(build(
      "http { server { listen 8080; root \"a b\"; "
      "location /x { try_files /a.html /b.html; } } }",
      srv));
  EXPECT_EQ(srv.listen_port, 8080);
  EXPECT_EQ(srv.document_root, "/srv/site/a b");
  ASSERT_EQ(srv.locations.size(), 1u);
  const Location& loc = srv.locations[0];
  EXPECT_EQ(loc.kind, Location::PREFIX);
  EXPECT_EQ(loc.matcher, "/x");
  EXPECT_FALSE(loc.stop_on_match);
  ASSERT_EQ(loc.try_files.size(), 2u);
  EXPECT_EQ(loc.try_files[0], "/a.html");
  EXPECT_EQ(loc.try_files[1], "/b.html");
}

TEST(ConfigBasic, EmptyConfigIsNotFound) {
  ServerConfig srv;
  EXPECT_FALSE(build("", srv));
}

TEST(ConfigBasic, MissingHttpBlockIsNotFound) {
  ServerConfig srv;
  EXPECT_FALSE(build("server { listen 80; }", srv));
}

TEST(ConfigBasic, MissingServerBlockIsNotFound) {
  ServerConfig srv;
  EXPECT_FALSE(build("http { include mime.types; }", srv));
}

TEST(ConfigBasic, FirstServerOfFirstHttpWins) {
  ServerConfig srv;
  ASSERT_TRUE(build(
      "http { server { listen 81; } server { listen 82; } }\n"
      "http { server { listen 83; } }",
      srv));
  EXPECT_EQ(srv.listen_port, 81);
}

TEST(ConfigBasic, NestedServerIsNotSearched) {
  ServerConfig srv;
  EXPECT_FALSE(build("http { wrapper { server { listen 81; } } }", srv));
}

TEST(ConfigBasic, LeadingStrayCloserHidesServer) {
  ServerConfig srv;
  EXPECT_FALSE(build("} http { server { listen 9000; } }", srv));
}

TEST(ConfigBasic, UnclosedConfigStillBuilds) {
  ServerConfig srv;
  ASSERT_TRUE(build("http { server { listen 9000; location /a {", srv));
  EXPECT_EQ(srv.listen_port, 9000);
  ASSERT_EQ(srv.locations.size(), 1u);
}

// ==================== DEFAULTS ====================

TEST(ConfigDefaults, EmptyServerBlock) {
  ServerConfig srv;
  ASSERT_TRUE(build("http { server { } }", srv));
  EXPECT_EQ(srv.listen_port, 80);
  EXPECT_EQ(srv.document_root, "/srv/site");
  ASSERT_EQ(srv.index_files.size(), 2u);
  EXPECT_EQ(srv.index_files[0], "index.html");
  EXPECT_EQ(srv.index_files[1], "index.htm");
  EXPECT_TRUE(srv.locations.empty());
}

TEST(ConfigDefaults, IndexListKeepsOrder) {
  ServerConfig srv;
  ASSERT_TRUE(build("http { server { index home.html default.htm; } }", srv));
  ASSERT_EQ(srv.index_files.size(), 2u);
  EXPECT_EQ(srv.index_files[0], "home.html");
  EXPECT_EQ(srv.index_files[1], "default.htm");
}

TEST(ConfigDefaults, EmptyIndexFallsBackToDefaults) {
  ServerConfig srv;
  ASSERT_TRUE(build("http { server { index \" \"; } }", srv));
  ASSERT_EQ(srv.index_files.size(), 2u);
  EXPECT_EQ(srv.index_files[0], "index.html");
}

TEST(ConfigDefaults, DuplicateDirectivesFirstWins) {
  ServerConfig srv;
  ASSERT_TRUE(build("http { server { listen 81; listen 82; root /a; "
                    "root /b; } }",
                    srv));
  EXPECT_EQ(srv.listen_port, 81);
  EXPECT_EQ(srv.document_root, "/a");
}

// ==================== ROOT ====================

TEST(ConfigRoot, RelativeRootIsResolvedAgainstBase) {
  ServerConfig srv;
  ASSERT_TRUE(build("http { server { root ./public/../dist/; } }", srv));
  EXPECT_EQ(srv.document_root, "/srv/site/dist");
}

TEST(ConfigRoot, AbsoluteRootIsNormalized) {
  ServerConfig srv;
  ASSERT_TRUE(build("http { server { root /var//www/./html/; } }", srv));
  EXPECT_EQ(srv.document_root, "/var/www/html");
}

TEST(ConfigRoot, QuotedWindowsStylePathIsOneArgument) {
  Config cfg;
  cfg.loadString("root \"c:\\\\path with spaces\";");
  const ParseResult& r = cfg.parseResult();
  ASSERT_EQ(r.nodes.size(), 1u);
  ASSERT_EQ(r.nodes[0].args.size(), 1u);
  EXPECT_EQ(r.nodes[0].args[0], "c:\\path with spaces");
}

// ==================== LISTEN ====================

TEST(ConfigListen, ParsesPortForms) {
  EXPECT_EQ(Config::parseListenPort(args1("8080")), 8080);
  EXPECT_EQ(Config::parseListenPort(args1("127.0.0.1:3000")), 3000);
  EXPECT_EQ(Config::parseListenPort(args1("[::]:8443")), 8443);
  EXPECT_EQ(Config::parseListenPort(args1("localhost:1")), 1);
}

TEST(ConfigListen, FallsBackTo80) {
  EXPECT_EQ(Config::parseListenPort(std::vector<std::string>()), 80);
  EXPECT_EQ(Config::parseListenPort(args1("localhost")), 80);
  EXPECT_EQ(Config::parseListenPort(args1("8080abc")), 80);
  EXPECT_EQ(Config::parseListenPort(args1("host:")), 80);
  EXPECT_EQ(Config::parseListenPort(args1("0")), 80);
  EXPECT_EQ(Config::parseListenPort(args1("65536")), 80);
  EXPECT_EQ(Config::parseListenPort(args1("99999999999999999999")), 80);
}

// ==================== LOCATIONS ====================

TEST(ConfigLocation, ModifiersSelectKind) {
  ServerConfig srv;
  ASSERT_TRUE(build(
      "http { server {\n"
      "  location = /health { }\n"
      "  location ~ \\.php$ { }\n"
      "  location ~* \\.PNG$ { }\n"
      "  location ^~ /api { proxy_pass http://127.0.0.1:9000; }\n"
      "  location /static { root assets; }\n"
      "} }",
      srv));
  ASSERT_EQ(srv.locations.size(), 5u);
  EXPECT_EQ(srv.locations[0].kind, Location::EXACT);
  EXPECT_EQ(srv.locations[0].matcher, "/health");
  EXPECT_EQ(srv.locations[1].kind, Location::REGEX);
  EXPECT_FALSE(srv.locations[1].case_insensitive);
  EXPECT_EQ(srv.locations[1].matcher, "\\.php$");
  EXPECT_EQ(srv.locations[2].kind, Location::REGEX);
  EXPECT_TRUE(srv.locations[2].case_insensitive);
  EXPECT_EQ(srv.locations[3].kind, Location::PREFIX);
  EXPECT_TRUE(srv.locations[3].stop_on_match);
  EXPECT_EQ(srv.locations[3].proxy_pass, "http://127.0.0.1:9000");
  EXPECT_EQ(srv.locations[4].kind, Location::PREFIX);
  EXPECT_FALSE(srv.locations[4].stop_on_match);
  EXPECT_EQ(srv.locations[4].root, "assets");
}

TEST(ConfigLocation, MissingMatcherDefaults) {
  ServerConfig srv;
  ASSERT_TRUE(build(
      "http { server { location = { } location ^~ { } location { } } }",
      srv));
  ASSERT_EQ(srv.locations.size(), 3u);
  EXPECT_EQ(srv.locations[0].matcher, "/");
  EXPECT_EQ(srv.locations[1].matcher, "/");
  EXPECT_EQ(srv.locations[2].matcher, "/");
}

TEST(ConfigLocation, EmptyTryFilesIsAbsent) {
  ServerConfig srv;
  ASSERT_TRUE(build("http { server { location / { try_files; } } }", srv));
  ASSERT_EQ(srv.locations.size(), 1u);
  EXPECT_TRUE(srv.locations[0].try_files.empty());
}

TEST(ConfigLocation, OnlyDirectChildrenAreRead) {
  ServerConfig srv;
  ASSERT_TRUE(build(
      "http { server { location / { if ($x) { proxy_pass http://a; } } } }",
      srv));
  ASSERT_EQ(srv.locations.size(), 1u);
  EXPECT_TRUE(srv.locations[0].proxy_pass.empty());
}

TEST(ConfigLocation, InvalidRegexThrows) {
  ServerConfig srv;
  EXPECT_THROW(build("http { server { location ~ \"([a-z\" { } } }", srv),
               ConfigError);
}

TEST(ConfigLocation, InvalidRegexMessageNamesLocation) {
  ServerConfig srv;
  try {
    build("http { server { location ~* \"(unclosed\" { } } }", srv);
    FAIL() << "expected ConfigError";
  } catch (const ConfigError& e) {
    EXPECT_NE(std::string(e.what()).find("~* (unclosed"), std::string::npos);
  }
}

TEST(ConfigLocation, BuiltConfigMatchesRegex) {
  ServerConfig srv;
  ASSERT_TRUE(
      build("http { server { location ~* \\.png$ { root img; } } }", srv));
  const Location* loc = srv.matchLocation("/a/B.PNG");
  ASSERT_TRUE(loc != NULL);
  EXPECT_EQ(loc->root, "img");
}

TEST(ConfigLocation, RegexUsesDigitClassAndGroups) {
  ServerConfig srv;
  ASSERT_TRUE(build(
      "http { server {\n"
      "  location ~ ^/api/v\\d+/ { proxy_pass http://backend; }\n"
      "  location ~* \\.(?:png|jpe?g)$ { root img; }\n"
      "} }",
      srv));
  const Location* api = srv.matchLocation("/api/v2/users");
  ASSERT_TRUE(api != NULL);
  EXPECT_EQ(api->proxy_pass, "http://backend");
  EXPECT_TRUE(srv.matchLocation("/api/vX/users") == NULL);
  const Location* img = srv.matchLocation("/a/photo.JPEG");
  ASSERT_TRUE(img != NULL);
  EXPECT_EQ(img->root, "img");
}

// ==================== FILES ====================

TEST(ConfigFile, LoadFileReadsAndParses) {
  TempDir dir;
  std::string path =
      dir.write("site.conf", "http {\n server {\n  listen 7001;\n }\n}\n");
  Config cfg;
  cfg.loadFile(path);
  ServerConfig srv;
  ASSERT_TRUE(cfg.buildServer(dir.path(), srv));
  EXPECT_EQ(srv.listen_port, 7001);
  EXPECT_EQ(srv.document_root, dir.path());
}

TEST(ConfigFile, LoadFileMissingThrows) {
  Config cfg;
  EXPECT_THROW(cfg.loadFile("/nonexistent/ngxpreview/nginx.conf"),
               std::runtime_error);
}

TEST(ConfigFile, FindConfigFilePrefersExplicitPath) {
  TempDir dir;
  std::string custom = dir.write("custom.conf", "");
  dir.write("nginx.conf", "");
  std::string found;
  ASSERT_TRUE(Config::findConfigFile(custom, dir.path(), found));
  EXPECT_EQ(found, custom);
}

TEST(ConfigFile, FindConfigFileFallsBackToBaseDir) {
  TempDir dir;
  std::string direct = dir.write("nginx.conf", "");
  std::string found;
  ASSERT_TRUE(Config::findConfigFile(dir.path() + "/missing.conf",
                                     dir.path(), found));
  EXPECT_EQ(found, direct);
  ASSERT_TRUE(Config::findConfigFile("", dir.path(), found));
  EXPECT_EQ(found, direct);
}

TEST(ConfigFile, FindConfigFileNothingFound) {
  TempDir dir;
  std::string found;
  EXPECT_FALSE(Config::findConfigFile("", dir.path(), found));
}

TEST(ConfigFile, FindConfigFileSearchesSubdirectories) {
  TempDir dir;
  dir.mkdir("deploy");
  dir.mkdir("deploy/nginx");
  dir.mkdir("conf");
  dir.write("deploy/nginx/nginx.conf", "");
  std::string shallow = dir.write("conf/nginx.conf", "");
  std::string found;
  ASSERT_TRUE(Config::findConfigFile("", dir.path(), found));
  EXPECT_EQ(found, shallow);
}

TEST(ConfigFile, FindConfigFileSkipsBuildOutputs) {
  TempDir dir;
  const char* skipped[] = {"dist", "build", "out", ".git", "node_modules"};
  for (size_t i = 0; i < 5; ++i) {
    dir.mkdir(skipped[i]);
    dir.write(std::string(skipped[i]) + "/nginx.conf", "");
  }
  std::string found;
  EXPECT_FALSE(Config::findConfigFile("", dir.path(), found));

  dir.mkdir("site");
  dir.mkdir("site/deeper");
  std::string nested = dir.write("site/deeper/nginx.conf", "");
  ASSERT_TRUE(Config::findConfigFile("", dir.path(), found));
  EXPECT_EQ(found, nested);
}

TEST(ConfigFile, FindConfigFileDirectHitBeatsNested) {
  TempDir dir;
  dir.mkdir("a");
  dir.write("a/nginx.conf", "");
  std::string direct = dir.write("nginx.conf", "");
  std::string found;
  ASSERT_TRUE(Config::findConfigFile("", dir.path(), found));
  EXPECT_EQ(found, direct);
}
