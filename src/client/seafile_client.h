#pragma once

#include "options.h"
#include "repository.h"
#include "seafile.pb.h"
#include "status.h"

#include <brpc/channel.h>
#include <brpc/http_method.h>
#include <memory>
#include <string>
#include <utility>
#include <vector>

// Repository ids are UUIDs in their 36 character textual form.
static constexpr size_t kRepoIdLen = 36;

// Account-level session against a Seafile server's api2 web API.
class SeafileClient {
  public:
    explicit SeafileClient(const Options &options);
    ~SeafileClient() = default;

    Status init();
    Status authenticate();
    std::pair<Status, std::vector<Repo>> list_repos();

    // Issues one request. uri is either a path on the server or an absolute
    // URL (download and upload links point at the file server).
    std::pair<Status, std::string> call(brpc::HttpMethod method,
                                        const std::string &uri,
                                        const std::string &body = "",
                                        const std::string &content_type = "");

  private:
    std::pair<Status, std::string> do_call(brpc::Channel *channel,
                                           brpc::HttpMethod method,
                                           const std::string &url,
                                           const std::string &body,
                                           const std::string &content_type);

    std::string server_url_;
    std::string username_;
    std::string password_;
    std::string token_;
    brpc::ChannelOptions channel_options_;
    brpc::Channel channel_;
};

// The repository this mount is bound to.
class SeafileRepository : public IRepository {
  public:
    SeafileRepository(std::shared_ptr<SeafileClient> client, Repo repo)
        : client_(std::move(client)), repo_(std::move(repo)) {}

    std::pair<Status, std::vector<DirEntry>>
    list_dir(const std::string &path, bool force_refresh) override;
    std::pair<Status, std::string> get_content(const std::string &path) override;
    Status upload(const std::string &dir, const std::string &name,
                  const std::string &content) override;
    Status create_dir(const std::string &path) override;
    Status remove_dir(const std::string &path) override;
    Status remove_file(const std::string &path) override;
    Status rename(const std::string &path, const std::string &new_name,
                  bool is_dir) override;
    Status move(const std::string &path, const std::string &dst_dir) override;

    const std::string &id() const override { return repo_.id(); }

  private:
    std::string repo_uri(const std::string &op, const std::string &path) const;

    std::shared_ptr<SeafileClient> client_;
    Repo repo_;
};

// Response decoding, kept apart from the transport.
std::pair<Status, std::string> parse_token(const std::string &json);
std::pair<Status, std::vector<Repo>> parse_repos(const std::string &json);
std::pair<Status, std::vector<DirEntry>>
parse_dir_entries(const std::string &json);
std::pair<Status, std::string> parse_link(const std::string &body);

// Empty repo_id picks the first repository.
std::pair<Status, Repo> select_repo(const std::vector<Repo> &repos,
                                    const std::string &repo_id);

std::string multipart_body(const std::string &boundary,
                           const std::vector<std::pair<std::string,
                                                       std::string>> &fields,
                           const std::string &file_name,
                           const std::string &content);
