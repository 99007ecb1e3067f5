#include <gtest/gtest.h>
#include "util/s3Helpers.hpp"

using namespace stratus::util;

TEST(S3XmlTest, ListBucketResultDecodesKeysAndTags) {
    const std::string body = R"(<?xml version="1.0" encoding="UTF-8"?>
<ListBucketResult xmlns="http://s3.amazonaws.com/doc/2006-03-01/">
  <Name>bucket</Name>
  <IsTruncated>true</IsTruncated>
  <Contents>
    <Key>drive/a&amp;b.txt</Key>
    <LastModified>2024-01-01T00:00:00.000Z</LastModified>
    <ETag>&quot;0f343b0931126a20f133d67c2b018a3b&quot;</ETag>
    <Size>1024</Size>
  </Contents>
  <Contents>
    <Key>drive/&lt;odd&gt; name.txt</Key>
    <ETag>"abc-2"</ETag>
    <Size>0</Size>
  </Contents>
  <NextContinuationToken>1ueGcxLPRx1Tr/XYExHnhbYLgveDs2J/wm36Hy4vbOwM=</NextContinuationToken>
</ListBucketResult>)";

    const auto page = parseListBucketResult(body);
    ASSERT_TRUE(page);
    ASSERT_EQ(page->entries.size(), 2u);
    EXPECT_EQ(page->entries[0].key, "drive/a&b.txt");
    EXPECT_EQ(page->entries[0].etag, "0f343b0931126a20f133d67c2b018a3b");
    EXPECT_EQ(page->entries[0].size, 1024u);
    EXPECT_EQ(page->entries[1].key, "drive/<odd> name.txt");
    EXPECT_EQ(page->entries[1].etag, "abc-2");
    EXPECT_EQ(page->continuation_token, "1ueGcxLPRx1Tr/XYExHnhbYLgveDs2J/wm36Hy4vbOwM=");
}

TEST(S3XmlTest, LastListPageHasNoToken) {
    const auto page = parseListBucketResult(
        "<ListBucketResult><IsTruncated>false</IsTruncated>"
        "<NextContinuationToken>stale</NextContinuationToken></ListBucketResult>");
    ASSERT_TRUE(page);
    EXPECT_TRUE(page->entries.empty());
    EXPECT_TRUE(page->continuation_token.empty());
}

TEST(S3XmlTest, ListPartsCollectsEtagsAndMarker) {
    const std::string body = R"(<ListPartsResult>
  <Bucket>bucket</Bucket>
  <UploadId>XXBsb2FkIElEIGZvciBlbHZpbmcncyBteS1tb3ZpZS5tMnRzIHVwbG9hZA</UploadId>
  <NextPartNumberMarker>3</NextPartNumberMarker>
  <IsTruncated>true</IsTruncated>
  <Part><PartNumber>1</PartNumber><ETag>&quot;etag-one&quot;</ETag><Size>5242880</Size></Part>
  <Part><PartNumber>3</PartNumber><ETag>"etag-three"</ETag><Size>10</Size></Part>
</ListPartsResult>)";

    const auto page = parseListPartsResult(body);
    ASSERT_TRUE(page);
    ASSERT_EQ(page->etags.size(), 2u);
    EXPECT_EQ(page->etags.at(1), "\"etag-one\"");
    EXPECT_EQ(page->etags.at(3), "\"etag-three\"");
    EXPECT_EQ(page->next_marker, "3");
}

TEST(S3XmlTest, UnexpectedBodiesAreRejected) {
    EXPECT_FALSE(parseListBucketResult("<Error><Code>AccessDenied</Code></Error>"));
    EXPECT_FALSE(parseListBucketResult("not xml <"));
    EXPECT_FALSE(parseListPartsResult("<ListBucketResult/>"));
}
