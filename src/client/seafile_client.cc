#include "seafile_client.h"
#include "util.h"

#include <brpc/controller.h>
#include <brpc/http_status_code.h>
#include <butil/fast_rand.h>
#include <butil/logging.h>
#include <cctype>
#include <json2pb/json_to_pb.h>

static const char kFormType[] = "application/x-www-form-urlencoded";

SeafileClient::SeafileClient(const Options &options)
    : server_url_(options.server_url), username_(options.username),
      password_(options.password), token_() {
    while (server_url_.size() > 1 && server_url_.back() == '/') {
        server_url_.pop_back();
    }
    channel_options_.protocol = brpc::PROTOCOL_HTTP;
    channel_options_.timeout_ms = options.timeout_ms;
    channel_options_.max_retry = 3;
}

Status SeafileClient::init() {
    if (channel_.Init(server_url_.c_str(), "", &channel_options_) != 0) {
        return Status::IOError("cannot initialize channel to " + server_url_);
    }
    return Status::OK();
}

Status SeafileClient::authenticate() {
    std::string body =
        form_encode({{"username", username_}, {"password", password_}});
    auto [s, resp] =
        call(brpc::HTTP_METHOD_POST, "/api2/auth-token/", body, kFormType);
    if (!s.ok()) {
        return s;
    }

    auto [ps, token] = parse_token(resp);
    if (!ps.ok()) {
        return ps;
    }
    token_ = token;
    LOG(INFO) << "authenticated as " << username_ << " on " << server_url_;
    return Status::OK();
}

std::pair<Status, std::vector<Repo>> SeafileClient::list_repos() {
    auto [s, resp] = call(brpc::HTTP_METHOD_GET, "/api2/repos/");
    if (!s.ok()) {
        return {s, {}};
    }
    return parse_repos(resp);
}

std::pair<Status, std::string>
SeafileClient::call(brpc::HttpMethod method, const std::string &uri,
                    const std::string &body, const std::string &content_type) {
    if (uri.compare(0, 7, "http://") == 0 ||
        uri.compare(0, 8, "https://") == 0) {
        // Links handed out by the server may live on another host.
        brpc::Channel channel;
        if (channel.Init(uri.c_str(), "", &channel_options_) != 0) {
            return {Status::IOError("cannot initialize channel to " + uri),
                    ""};
        }
        return do_call(&channel, method, uri, body, content_type);
    }
    return do_call(&channel_, method, server_url_ + uri, body, content_type);
}

std::pair<Status, std::string>
SeafileClient::do_call(brpc::Channel *channel, brpc::HttpMethod method,
                       const std::string &url, const std::string &body,
                       const std::string &content_type) {
    brpc::Controller cntl;
    cntl.http_request().uri() = url;
    cntl.http_request().set_method(method);
    cntl.http_request().SetHeader("Accept", "application/json");
    if (!token_.empty()) {
        cntl.http_request().SetHeader("Authorization", "Token " + token_);
    }
    if (!content_type.empty()) {
        cntl.http_request().set_content_type(content_type);
    }
    if (!body.empty()) {
        cntl.request_attachment().append(body);
    }

    channel->CallMethod(nullptr, &cntl, nullptr, nullptr, nullptr);

    if (cntl.Failed()) {
        const int code = cntl.http_response().status_code();
        VLOG(1) << brpc::HttpMethod2Str(method) << " " << url << " -> "
                << code << ": " << cntl.ErrorText();
        if (code == brpc::HTTP_STATUS_NOT_FOUND) {
            return {Status::NotFound(url), ""};
        }
        return {Status::IOError(cntl.ErrorText()), ""};
    }
    return {Status::OK(), cntl.response_attachment().to_string()};
}

std::string SeafileRepository::repo_uri(const std::string &op,
                                        const std::string &path) const {
    std::string uri = "/api2/repos/" + repo_.id() + "/" + op + "/";
    if (!path.empty()) {
        uri += "?p=" + url_encode(path);
    }
    return uri;
}

std::pair<Status, std::vector<DirEntry>>
SeafileRepository::list_dir(const std::string &path, bool /*force_refresh*/) {
    // Nothing is cached at this level, every listing is a fresh one.
    auto [s, resp] =
        client_->call(brpc::HTTP_METHOD_GET, repo_uri("dir", path));
    if (!s.ok()) {
        return {s, {}};
    }
    return parse_dir_entries(resp);
}

std::pair<Status, std::string>
SeafileRepository::get_content(const std::string &path) {
    auto [s, resp] = client_->call(brpc::HTTP_METHOD_GET,
                                   repo_uri("file", path) + "&reuse=1");
    if (!s.ok()) {
        return {s, ""};
    }
    auto [ls, link] = parse_link(resp);
    if (!ls.ok()) {
        return {ls, ""};
    }
    return client_->call(brpc::HTTP_METHOD_GET, link);
}

Status SeafileRepository::upload(const std::string &dir,
                                 const std::string &name,
                                 const std::string &content) {
    auto [s, resp] =
        client_->call(brpc::HTTP_METHOD_GET, repo_uri("upload-link", dir));
    if (!s.ok()) {
        return s;
    }
    auto [ls, link] = parse_link(resp);
    if (!ls.ok()) {
        return ls;
    }

    const std::string boundary =
        "----seafs" + std::to_string(butil::fast_rand());
    std::string body = multipart_body(
        boundary, {{"parent_dir", dir}, {"replace", "1"}}, name, content);
    auto [us, _] = client_->call(brpc::HTTP_METHOD_POST, link, body,
                                 "multipart/form-data; boundary=" + boundary);
    return us;
}

Status SeafileRepository::create_dir(const std::string &path) {
    auto [s, _] = client_->call(brpc::HTTP_METHOD_POST, repo_uri("dir", path),
                                form_encode({{"operation", "mkdir"}}),
                                kFormType);
    return s;
}

Status SeafileRepository::remove_dir(const std::string &path) {
    auto [s, _] =
        client_->call(brpc::HTTP_METHOD_DELETE, repo_uri("dir", path));
    return s;
}

Status SeafileRepository::remove_file(const std::string &path) {
    auto [s, _] =
        client_->call(brpc::HTTP_METHOD_DELETE, repo_uri("file", path));
    return s;
}

Status SeafileRepository::rename(const std::string &path,
                                 const std::string &new_name, bool is_dir) {
    auto [s, _] = client_->call(
        brpc::HTTP_METHOD_POST, repo_uri(is_dir ? "dir" : "file", path),
        form_encode({{"operation", "rename"}, {"newname", new_name}}),
        kFormType);
    return s;
}

Status SeafileRepository::move(const std::string &path,
                               const std::string &dst_dir) {
    auto [parent, name] = split_path_from_target(path);
    auto [s, _] = client_->call(brpc::HTTP_METHOD_POST,
                                repo_uri("fileops/move", parent),
                                form_encode({{"file_names", name},
                                             {"dst_repo", repo_.id()},
                                             {"dst_dir", dst_dir}}),
                                kFormType);
    return s;
}

std::pair<Status, std::string> parse_token(const std::string &json) {
    AuthToken token;
    std::string err;
    if (!json2pb::JsonToProtoMessage(json, &token, &err)) {
        return {Status::Corruption("auth-token: " + err), ""};
    }
    if (token.token().empty()) {
        return {Status::Corruption("auth-token: no token in response"), ""};
    }
    return {Status::OK(), token.token()};
}

std::pair<Status, std::vector<Repo>> parse_repos(const std::string &json) {
    // api2 answers with a bare array; give it a field to land in.
    RepoList list;
    std::string err;
    if (!json2pb::JsonToProtoMessage("{\"repos\":" + json + "}", &list,
                                     &err)) {
        return {Status::Corruption("repos: " + err), {}};
    }

    std::vector<Repo> repos;
    for (const auto &repo : list.repos()) {
        if (repo.id().size() != kRepoIdLen) {
            return {Status::Corruption("malformed repository id '" +
                                       repo.id() + "'"),
                    {}};
        }
        repos.push_back(repo);
    }
    return {Status::OK(), repos};
}

std::pair<Status, std::vector<DirEntry>>
parse_dir_entries(const std::string &json) {
    DirEntryList list;
    std::string err;
    if (!json2pb::JsonToProtoMessage("{\"entries\":" + json + "}", &list,
                                     &err)) {
        return {Status::Corruption("dir: " + err), {}};
    }
    return {Status::OK(),
            std::vector<DirEntry>(list.entries().begin(),
                                  list.entries().end())};
}

std::pair<Status, std::string> parse_link(const std::string &body) {
    std::string link = body;
    while (!link.empty() && isspace(static_cast<unsigned char>(link.back()))) {
        link.pop_back();
    }
    size_t start = 0;
    while (start < link.size() &&
           isspace(static_cast<unsigned char>(link[start]))) {
        start++;
    }
    link = link.substr(start);

    if (link.size() >= 2 && link.front() == '"' && link.back() == '"') {
        link = link.substr(1, link.size() - 2);
    }

    std::string out;
    for (size_t i = 0; i < link.size(); i++) {
        if (link[i] == '\\' && i + 1 < link.size() && link[i + 1] == '/') {
            continue;
        }
        out.push_back(link[i]);
    }

    if (out.compare(0, 7, "http://") != 0 &&
        out.compare(0, 8, "https://") != 0) {
        return {Status::Corruption("not a link: " + body), ""};
    }
    return {Status::OK(), out};
}

std::pair<Status, Repo> select_repo(const std::vector<Repo> &repos,
                                    const std::string &repo_id) {
    if (repos.empty()) {
        return {Status::NotFound("account has no repositories"), Repo()};
    }
    if (repo_id.empty()) {
        return {Status::OK(), repos.front()};
    }
    for (const auto &repo : repos) {
        if (repo.id() == repo_id) {
            return {Status::OK(), repo};
        }
    }
    return {Status::NotFound("no repository with id " + repo_id), Repo()};
}

std::string multipart_body(
    const std::string &boundary,
    const std::vector<std::pair<std::string, std::string>> &fields,
    const std::string &file_name, const std::string &content) {
    std::string body;
    for (const auto &field : fields) {
        body += "--" + boundary + "\r\n";
        body += "Content-Disposition: form-data; name=\"" + field.first +
                "\"\r\n\r\n";
        body += field.second + "\r\n";
    }
    body += "--" + boundary + "\r\n";
    body += "Content-Disposition: form-data; name=\"file\"; filename=\"" +
            file_name + "\"\r\n";
    body += "Content-Type: application/octet-stream\r\n\r\n";
    body += content;
    body += "\r\n--" + boundary + "--\r\n";
    return body;
}
