#include "file/file_catalog.hpp"
#include "common/logger.hpp"
#include <sys/stat.h>
#include <dirent.h>
#include <fcntl.h>
#include <unistd.h>
#include <algorithm>
#include <cerrno>
#include <cstring>

static bool ensure_dir(const std::string &dir)
{
    struct stat st{};
    if (::stat(dir.c_str(), &st) == 0)
        return S_ISDIR(st.st_mode);
    // 先建父目录
    auto pos = dir.find_last_of('/');
    if (pos != std::string::npos && pos > 0)
    {
        std::string parent = dir.substr(0, pos);
        if (!ensure_dir(parent))
            return false;
    }
    return ::mkdir(dir.c_str(), 0755) == 0 || errno == EEXIST;
}

bool FileCatalog::init()
{
    if (!ensure_dir(root_))
    {
        LOG_ERROR("cannot create directory %s: %s", root_.c_str(), strerror(errno));
        return false;
    }
    return true;
}

std::string FileCatalog::temp_path(const std::string &name) const { return root_ + "/" + name + ".part"; }
std::string FileCatalog::final_path(const std::string &name) const { return root_ + "/" + name; }

bool FileCatalog::valid_name(const std::string &name)
{
    if (name.empty() || name == "." || name == "..")
        return false;
    return name.find('/') == std::string::npos && name.find('\0') == std::string::npos;
}

bool FileCatalog::list(std::vector<std::string> &names) const
{
    names.clear();
    DIR *dir = ::opendir(root_.c_str());
    if (!dir)
    {
        LOG_WARN("opendir %s failed: %s", root_.c_str(), strerror(errno));
        return false;
    }
    while (dirent *ent = ::readdir(dir))
    {
        std::string name = ent->d_name;
        if (name == "." || name == "..")
            continue;
        uint64_t size = 0;
        if (stat_blob(name, size))
            names.push_back(name);
    }
    ::closedir(dir);
    std::sort(names.begin(), names.end());
    return true;
}

bool FileCatalog::stat_blob(const std::string &name, uint64_t &size) const
{
    if (!valid_name(name))
        return false;
    struct stat st{};
    if (::stat(final_path(name).c_str(), &st) != 0 || !S_ISREG(st.st_mode))
        return false;
    size = static_cast<uint64_t>(st.st_size);
    return true;
}

int FileCatalog::open_blob(const std::string &name) const
{
    if (!valid_name(name))
        return -1;
    return ::open(final_path(name).c_str(), O_RDONLY | O_CLOEXEC);
}
