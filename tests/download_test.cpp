#include "checksum.hpp"
#include "download.hpp"
#include "test_support.hpp"

#include <gtest/gtest.h>

#include <sstream>
#include <stdexcept>

using namespace dlbuild;
using namespace dlbuild::test;

TEST(Download, CacheFilename){
    EXPECT_EQ(cacheFilename("https://example.org/src/foo-1.0.tar.gz"), "foo-1.0.tar.gz");
    EXPECT_EQ(cacheFilename("https://example.org/src/foo-1.0.tar.gz?download=1"), "foo-1.0.tar.gz");
    EXPECT_EQ(cacheFilename("http://example.org/bar.zip#frag"), "bar.zip");
}

TEST(Download, SupportedUrls){
    EXPECT_TRUE(isSupportedUrl("https://example.org/foo.tar.gz"));
    EXPECT_TRUE(isSupportedUrl("http://example.org/foo.tar.gz"));
    EXPECT_FALSE(isSupportedUrl("ftp://example.org/foo.tar.gz"));
    EXPECT_FALSE(isSupportedUrl("git://example.org/foo.git"));
    EXPECT_FALSE(isSupportedUrl("https://example.org/"));
    EXPECT_FALSE(isSupportedUrl("foo.tar.gz"));
}

TEST(Download, FetchWritesFileAndDigest){
    TempDir tmp;
    FakeTransport net;
    const std::string url = "https://example.org/foo-1.0.tar.gz";
    net.bodies[url] = "fonte do foo";

    SourceFetcher fetcher(net, tmp.path());
    std::string digest, err;
    EXPECT_EQ(fetcher.ensureSource(url, md5Hex("fonte do foo"), digest, err), SourceFetcher::Status::Fetched) << err;
    EXPECT_EQ(digest, md5Hex("fonte do foo"));
    EXPECT_EQ(readText(tmp.path() / "foo-1.0.tar.gz"), "fonte do foo");
    EXPECT_EQ(net.requests.size(), 1u);
}

TEST(Download, CacheHitIsIdempotent){
    TempDir tmp;
    FakeTransport net;
    const std::string url = "https://example.org/foo-1.0.tar.gz";
    writeText(tmp.path() / "foo-1.0.tar.gz", "já baixado");
    const std::string expected = md5Hex("já baixado");

    SourceFetcher fetcher(net, tmp.path());
    for(int i=0;i<2;++i){
        std::string digest, err;
        EXPECT_EQ(fetcher.ensureSource(url, expected, digest, err), SourceFetcher::Status::Cached);
        EXPECT_EQ(digest, expected);
    }
    EXPECT_TRUE(net.requests.empty());
    EXPECT_EQ(readText(tmp.path() / "foo-1.0.tar.gz"), "já baixado");
}

TEST(Download, StaleCacheIsFetchedAgain){
    TempDir tmp;
    FakeTransport net;
    const std::string url = "https://example.org/foo-1.0.tar.gz";
    writeText(tmp.path() / "foo-1.0.tar.gz", "truncado");
    net.bodies[url] = "completo";

    SourceFetcher fetcher(net, tmp.path());
    std::string digest, err;
    EXPECT_EQ(fetcher.ensureSource(url, md5Hex("completo"), digest, err), SourceFetcher::Status::Fetched);
    EXPECT_EQ(readText(tmp.path() / "foo-1.0.tar.gz"), "completo");
}

TEST(Download, FailureRemovesPartialFile){
    TempDir tmp;
    FakeTransport net;
    const std::string url = "https://example.org/foo-1.0.tar.gz";
    net.failing.insert(url);

    SourceFetcher fetcher(net, tmp.path());
    std::string digest, err;
    EXPECT_EQ(fetcher.ensureSource(url, kEmptyMd5, digest, err), SourceFetcher::Status::Failed);
    EXPECT_NE(err.find("Couldn't connect"), std::string::npos) << err;
    EXPECT_FALSE(fs::exists(tmp.path() / "foo-1.0.tar.gz"));
}

TEST(Download, UnsupportedUrlMakesNoRequest){
    TempDir tmp;
    FakeTransport net;
    SourceFetcher fetcher(net, tmp.path());
    std::string digest, err;
    EXPECT_EQ(fetcher.ensureSource("ftp://example.org/foo.tar.gz", kEmptyMd5, digest, err),
              SourceFetcher::Status::Unsupported);
    EXPECT_TRUE(net.requests.empty());
}

namespace {

class ThrowingSink : public ByteSink {
public:
    bool write(const char*, std::size_t) override { throw std::runtime_error("digest falhou"); }
};

class RefusingSink : public ByteSink {
public:
    bool write(const char*, std::size_t) override { return false; }
};

} // namespace

TEST(CurlTransport, WriteCallbackForwardsToSink){
    std::ostringstream os;
    StreamSink sink(os);
    char data[] = "abcdef";
    EXPECT_EQ(curlWriteToSink(data, 2, 3, &sink), 6u);
    EXPECT_EQ(os.str(), "abcdef");
}

TEST(CurlTransport, WriteCallbackAbortsOnSinkFailure){
    char data[] = "abc";
    RefusingSink refusing;
    EXPECT_EQ(curlWriteToSink(data, 1, 3, &refusing), 0u);
    ThrowingSink throwing;
    EXPECT_EQ(curlWriteToSink(data, 1, 3, &throwing), 0u);
}

TEST(CurlTransport, OnlyHttpProtocolsAreAllowed){
    CurlTransport curl;
    std::ostringstream os;
    StreamSink sink(os);
    std::string err;
    EXPECT_FALSE(curl.get("ftp://127.0.0.1:1/foo.tar.gz", sink, err));
    EXPECT_NE(err.find("Protocol"), std::string::npos) << err;
    EXPECT_TRUE(os.str().empty());
}
