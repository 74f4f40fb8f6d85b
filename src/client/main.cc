#include "options.h"
#include "repo_engine.h"
#include "seafile_client.h"
#include "seafs_fuse.h"

#include <butil/logging.h>
#include <memory>
#include <sys/stat.h>
#include <vector>

int main(int argc, char *argv[]) {
    const Options options = parse_options(&argc, &argv);

    auto client = std::make_shared<SeafileClient>(options);
    Status s = client->init();
    if (s.ok()) {
        s = client->authenticate();
    }
    if (!s.ok()) {
        LOG(ERROR) << "Failed to connect to " << options.server_url << ": "
                   << s.ToString();
        return -1;
    }

    auto [ls, repos] = client->list_repos();
    if (!ls.ok()) {
        LOG(ERROR) << "Failed to list repositories: " << ls.ToString();
        return -1;
    }
    auto [rs, repo] = select_repo(repos, options.repo_id);
    if (!rs.ok()) {
        LOG(ERROR) << "Failed to select repository: " << rs.ToString();
        return -1;
    }
    LOG(INFO) << "Current repo's ID: " << repo.id() << " (" << repo.name()
              << ")";

    RepoEngine engine(options,
                      std::make_shared<SeafileRepository>(client, repo));

    std::vector<char *> fuse_argv;
    for (const auto &arg : options.fuse_args) {
        fuse_argv.push_back(const_cast<char *>(arg.c_str()));
    }
    fuse_argv.push_back(nullptr);

    umask(0);
    return fuse_main(static_cast<int>(options.fuse_args.size()),
                     fuse_argv.data(), &seafs_oper, &engine);
}
