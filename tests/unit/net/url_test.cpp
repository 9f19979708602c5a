#include <gtest/gtest.h>

#include <civdl/net/url.h>

using namespace civdl;
using namespace civdl::net;

TEST(UrlTest, PercentEncodeKeepsUnreserved) {
    EXPECT_EQ(percentEncode("abc-XYZ_0.9~"), "abc-XYZ_0.9~");
    EXPECT_EQ(percentEncode("a b&c=d/e"), "a%20b%26c%3Dd%2Fe");
}

TEST(UrlTest, PercentDecodeHandlesMalformedEscapes) {
    EXPECT_EQ(percentDecode("model%20v1.safetensors"), "model v1.safetensors");
    EXPECT_EQ(percentDecode("100%"), "100%");
    EXPECT_EQ(percentDecode("%zz"), "%zz");
    EXPECT_EQ(percentDecode("a+b"), "a+b");
    EXPECT_EQ(percentDecode("a+b", true), "a b");
}

TEST(UrlTest, AppendQueryPicksSeparator) {
    QueryParams p{{"limit", "10"}, {"cursor", "a b"}};
    EXPECT_EQ(appendQuery("https://h/api/v1/images", p),
              "https://h/api/v1/images?limit=10&cursor=a%20b");
    EXPECT_EQ(appendQuery("https://h/x?y=1", QueryParams{{"token", "k"}}), "https://h/x?y=1&token=k");
    EXPECT_EQ(appendQuery("https://h/x", QueryParams{}), "https://h/x");
}

TEST(UrlTest, QueryParamsSetReplacesInPlace) {
    QueryParams p{{"a", "1"}, {"b", "2"}};
    p.set("a", "3");
    ASSERT_EQ(p.size(), 2u);
    EXPECT_EQ(p.get("a").value_or(""), "3");
    EXPECT_EQ(appendQuery("u", p), "u?a=3&b=2");
}

TEST(UrlTest, PathAndQueryValue) {
    const std::string url = "https://host:8080/files/a%20b.bin?filename=x%2By.bin&id=42#frag";
    EXPECT_EQ(urlPath(url), "/files/a%20b.bin");
    EXPECT_EQ(queryValue(url, "filename").value_or(""), "x+y.bin");
    EXPECT_EQ(queryValue(url, "id").value_or(""), "42");
    EXPECT_FALSE(queryValue(url, "missing").has_value());
    EXPECT_EQ(urlPath("https://host"), "");
}

TEST(UrlTest, OriginKeepsSchemeHostAndPort) {
    EXPECT_EQ(urlOrigin("https://civitai.com/api/v1"), "https://civitai.com");
    EXPECT_EQ(urlOrigin("http://localhost:8080/api/v1?x=1"), "http://localhost:8080");
    EXPECT_EQ(urlOrigin("https://mirror.test"), "https://mirror.test");
    EXPECT_EQ(urlOrigin("/relative/path"), "");
}
