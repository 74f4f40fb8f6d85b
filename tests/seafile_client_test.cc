#include "seafile_client.h"
#include "seafs_fuse.h"

#include <cerrno>
#include <gtest/gtest.h>

TEST(SeafileParseTest, Token) {
    auto [s, token] =
        parse_token("{\"token\": \"24fd3c026886e3121b2ca630805ed425c272cb96\"}");
    ASSERT_TRUE(s.ok()) << s.ToString();
    EXPECT_EQ(token, "24fd3c026886e3121b2ca630805ed425c272cb96");

    auto [bad, none] = parse_token("{\"non_field_errors\": [\"bad\"]}");
    EXPECT_TRUE(bad.is_corruption());
}

TEST(SeafileParseTest, Repos) {
    auto [s, repos] = parse_repos(
        "[{\"permission\": \"rw\", \"encrypted\": false, \"mtime\": 1400054900,"
        " \"owner\": \"user@mail.com\", \"id\": "
        "\"f158d1dd-cc19-412c-b143-2ac83f352290\", \"size\": 0, \"name\": "
        "\"foo\", \"type\": \"repo\", \"virtual\": false, \"desc\": \"\"},"
        " {\"id\": \"0a1b2c3d-4e5f-6a7b-8c9d-0e1f2a3b4c5d\", \"name\": "
        "\"bar\"}]");
    ASSERT_TRUE(s.ok()) << s.ToString();
    ASSERT_EQ(repos.size(), 2u);
    EXPECT_EQ(repos[0].name(), "foo");
    EXPECT_EQ(repos[0].mtime(), 1400054900);
    EXPECT_EQ(repos[1].id(), "0a1b2c3d-4e5f-6a7b-8c9d-0e1f2a3b4c5d");
}

TEST(SeafileParseTest, ReposWithMalformedIdAreRejected) {
    auto [s, repos] = parse_repos("[{\"id\": \"short\", \"name\": \"x\"}]");
    EXPECT_TRUE(s.is_corruption());
}

TEST(SeafileParseTest, DirEntries) {
    auto [s, entries] = parse_dir_entries(
        "[{\"id\": \"0000000000000000000000000000000000000000\", \"type\": "
        "\"dir\", \"name\": \"photos\", \"mtime\": 1400054901},"
        " {\"id\": \"a1b2c3\", \"type\": \"file\", \"name\": \"a.md\", "
        "\"size\": 12, \"mtime\": 1400054902}]");
    ASSERT_TRUE(s.ok()) << s.ToString();
    ASSERT_EQ(entries.size(), 2u);
    EXPECT_EQ(entries[0].type(), "dir");
    EXPECT_FALSE(entries[0].has_size());
    EXPECT_EQ(entries[1].name(), "a.md");
    EXPECT_EQ(entries[1].size(), 12);

    auto [empty_status, empty] = parse_dir_entries("[]");
    ASSERT_TRUE(empty_status.ok());
    EXPECT_TRUE(empty.empty());

    auto [bad, none] = parse_dir_entries("<html>502</html>");
    EXPECT_TRUE(bad.is_corruption());
}

TEST(SeafileParseTest, Links) {
    auto [s, link] = parse_link(
        "\"http://127.0.0.1:8082/files/5e1a/a.md\"\n");
    ASSERT_TRUE(s.ok());
    EXPECT_EQ(link, "http://127.0.0.1:8082/files/5e1a/a.md");

    auto [s2, escaped] = parse_link("\"https:\\/\\/cloud.example\\/up\"");
    ASSERT_TRUE(s2.ok());
    EXPECT_EQ(escaped, "https://cloud.example/up");

    auto [bad, none] = parse_link("{\"error_msg\": \"denied\"}");
    EXPECT_TRUE(bad.is_corruption());
}

TEST(SeafileParseTest, SelectRepo) {
    Repo first;
    first.set_id("f158d1dd-cc19-412c-b143-2ac83f352290");
    Repo second;
    second.set_id("0a1b2c3d-4e5f-6a7b-8c9d-0e1f2a3b4c5d");
    std::vector<Repo> repos{first, second};

    auto [s, picked] = select_repo(repos, "");
    ASSERT_TRUE(s.ok());
    EXPECT_EQ(picked.id(), first.id());

    auto [s2, by_id] = select_repo(repos, second.id());
    ASSERT_TRUE(s2.ok());
    EXPECT_EQ(by_id.id(), second.id());

    auto [s3, missing] = select_repo(repos, "nope");
    EXPECT_TRUE(s3.is_not_found());

    auto [s4, none] = select_repo({}, "");
    EXPECT_TRUE(s4.is_not_found());
}

TEST(SeafileParseTest, MultipartBody) {
    std::string body =
        multipart_body("XyZ", {{"parent_dir", "/docs"}}, "a.md", "# hi");
    EXPECT_EQ(body,
              "--XyZ\r\n"
              "Content-Disposition: form-data; name=\"parent_dir\"\r\n\r\n"
              "/docs\r\n"
              "--XyZ\r\n"
              "Content-Disposition: form-data; name=\"file\"; "
              "filename=\"a.md\"\r\n"
              "Content-Type: application/octet-stream\r\n\r\n"
              "# hi\r\n"
              "--XyZ--\r\n");
}

TEST(StatusToErrnoTest, MapsTaxonomy) {
    EXPECT_EQ(status_to_errno(Status::OK()), 0);
    EXPECT_EQ(status_to_errno(Status::NotFound("x")), -ENOENT);
    EXPECT_EQ(status_to_errno(Status::IOError("x")), -EIO);
    EXPECT_EQ(status_to_errno(Status::Corruption("x")), -EIO);
    EXPECT_EQ(status_to_errno(Status::InvalidArgument("x")), -EINVAL);
    EXPECT_EQ(status_to_errno(Status::Conflict("x")), -EFAULT);
}
