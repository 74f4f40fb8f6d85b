#pragma once

#include "seafile.pb.h"
#include "status.h"

#include <string>
#include <utility>
#include <vector>

// One remote repository, addressed by absolute paths inside it.
class IRepository {
  public:
    virtual ~IRepository() = default;

    virtual std::pair<Status, std::vector<DirEntry>>
    list_dir(const std::string &path, bool force_refresh) = 0;

    virtual std::pair<Status, std::string>
    get_content(const std::string &path) = 0;

    // Uploads the whole content, replacing any existing file of that name.
    virtual Status upload(const std::string &dir, const std::string &name,
                          const std::string &content) = 0;

    virtual Status create_dir(const std::string &path) = 0;
    virtual Status remove_dir(const std::string &path) = 0;
    virtual Status remove_file(const std::string &path) = 0;

    // Renames within the parent directory; new_name is a base name.
    virtual Status rename(const std::string &path, const std::string &new_name,
                          bool is_dir) = 0;

    // Moves path into dst_dir keeping its base name.
    virtual Status move(const std::string &path,
                        const std::string &dst_dir) = 0;

    virtual const std::string &id() const = 0;
};
