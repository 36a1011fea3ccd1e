#include <coil/configuration.hpp>

#include <filesystem>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <sstream>
#include <stdexcept>
#include <unordered_map>
#include <vector>
#include <boost/interprocess/sync/file_lock.hpp>
#include <boost/property_tree/ptree.hpp>
#include <boost/property_tree/ini_parser.hpp>

namespace fs = std::filesystem;

// specialize ini_parser write_keys so as to use git-style spacing
namespace boost { namespace property_tree { namespace ini_parser {
namespace detail {
template <>
void write_keys<ptree>(std::basic_ostream<ptree::key_type::value_type> & stream, const ptree& pt, bool throw_on_children)
{
    typedef typename ptree::key_type::value_type Ch;
    for (typename ptree::const_iterator it = pt.begin(), end = pt.end();
         it != end; ++it)
    {
        if (!it->second.empty()) {
            if (throw_on_children) {
                BOOST_PROPERTY_TREE_THROW(ini_parser_error(
                    "ptree is too deep", "", 0));
            }
            continue;
        }
        if (throw_on_children) {
            // indent innermost keys
            stream << Ch('\t');
        }
        stream << it->first << " = "
            << it->second.template get_value<
                std::basic_string<Ch> >()
            << Ch('\n');
    }
}
}
} } }

namespace coil {

namespace {

using boost::property_tree::ptree;

fs::path const & config_dir_user()
{
    static struct ConfigDirUser
    {
        ConfigDirUser()
        {
            char const* xdg_config_home = getenv("XDG_CONFIG_HOME");
            if (xdg_config_home != nullptr) {
                path = fs::path(xdg_config_home);
            }
            if (path.empty()) {
                char const* home = getenv("HOME");
                if (home != nullptr) {
                    path = fs::path(home) / ".config";
                }
            }
            if (!path.empty()) {
                path /= "coil";
            } else {
                throw std::runtime_error("Neither XDG_CONFIG_HOME nor HOME is set.");
            }
        }

        fs::path path;
    } config_dir_user;

    return config_dir_user.path;
};

std::string_view path_helper(fs::path& path, std::span<std::string_view const> subpaths, bool is_dir) {
    for (const auto& subpath : subpaths) {
        path /= subpath;
    }
    if (is_dir) {
        fs::create_directories(path);
        path /= "";
    } else {
        fs::create_directories(path.parent_path());
    }
    return path.native();
}

// {section, key} or {section, subsection, key} -> git-style [section "subsection"], key
std::pair<std::string, std::string> split_locator(std::span<std::string_view const> locator) {
    if (locator.size() == 2) {
        return {std::string(locator[0]), std::string(locator[1])};
    }
    if (locator.size() == 3) {
        std::stringstream ss;
        ss << locator[0] << ' ' << std::quoted(locator[1]);
        return {ss.str(), std::string(locator[2])};
    }
    throw std::invalid_argument("configuration locator must be {section, key} or {section, subsection, key}");
}

ptree * find_child(ptree & pt, std::string const& key) {
    auto it = pt.find(key);
    return it == pt.not_found() ? nullptr : &it->second;
}

class ConfigurationImpl {
public:
    ConfigurationImpl(std::span<std::string_view const> subpath, bool user_wide)
    : path_(user_wide ? Configuration::path_user(subpath) : Configuration::path_local(subpath))
    {
        if (!user_wide) {
            std::string path_user(Configuration::path_user(subpath));
            if (fs::exists(path_user)) {
                dflt_lock_ = boost::interprocess::file_lock(path_user.c_str());
                if (!dflt_lock_.try_lock_sharable()) {
                    std::cerr << "Waiting for another process to finish with " << path_user << " ..." << std::endl;
                    dflt_lock_.lock_sharable();
                }
                boost::property_tree::ini_parser::read_ini(path_user, dflt_);
            }
        }
        if (fs::exists(path_)) {
            lock_ = boost::interprocess::file_lock(path_.c_str());
            if (!lock_.try_lock()) {
                std::cerr << "Waiting for another process to finish with " << path_ << " ..." << std::endl;
                lock_.lock();
            }
            boost::property_tree::ini_parser::read_ini(path_, ptree_);
        }
    }

    ~ConfigurationImpl() {
        bool changed = false;
        for (auto & [value, original] : accessed_) {
            if (value->data() != original) {
                changed = true;
            }
        }
        if (!changed) {
            return;
        }
        // drop lookups that created nodes without giving them a value of their own
        for (auto it = created_.rbegin(); it != created_.rend(); ++ it) {
            auto & [parent, key] = *it;
            auto child = parent->find(key);
            if (child == parent->not_found() || !child->second.empty()) {
                continue;
            }
            auto original = accessed_.find(&child->second);
            if (original == accessed_.end() || child->second.data() == original->second) {
                parent->erase(parent->to_iterator(child));
            }
        }
        try {
            boost::property_tree::ini_parser::write_ini(path_, ptree_);
        } catch (boost::property_tree::ini_parser_error const& e) {
            std::cerr << "Could not write " << path_ << ": " << e.what() << std::endl;
        }
    }

    std::string& operator[](std::span<std::string_view const> locator) {
        std::lock_guard<std::mutex> lk(mtx_);
        auto [section, key] = split_locator(locator);

        auto * section_pt = find_child(ptree_, section);
        if (!section_pt) {
            section_pt = &ptree_.push_back(std::make_pair(section, ptree()))->second;
            created_.emplace_back(&ptree_, section);
        }
        auto * value = find_child(*section_pt, key);
        if (!value) {
            value = &section_pt->push_back(std::make_pair(key, ptree()))->second;
            created_.emplace_back(section_pt, key);
            if (auto * dflt_section = find_child(dflt_, section)) {
                if (auto * dflt = find_child(*dflt_section, key)) {
                    value->data() = dflt->data();
                }
            }
        }
        accessed_.try_emplace(value, value->data());
        return value->data();
    }

private:
    std::string path_;
    ptree ptree_;
    ptree dflt_;
    boost::interprocess::file_lock lock_;
    boost::interprocess::file_lock dflt_lock_;
    std::mutex mtx_;
    std::unordered_map<ptree*, std::string> accessed_;
    std::vector<std::pair<ptree*, std::string>> created_;
};

} // namespace

bool Configuration::init() {
    try {
        path_local();
    } catch (std::invalid_argument const& e) {
        fs::create_directory(".coil");
        return true;
    }
    return false;
}

Configuration::Configuration(std::span<std::string_view const> subpath, bool user_wide)
    : impl_(reinterpret_cast<void*>(new ConfigurationImpl(subpath, user_wide))) {}

Configuration::~Configuration() {
    delete reinterpret_cast<ConfigurationImpl*>(impl_);
}

std::string& Configuration::operator[](std::span<std::string_view const> locator) {
    return (*reinterpret_cast<ConfigurationImpl*>(impl_))[locator];
}

std::string_view Configuration::path_local(std::span<std::string_view const> subpaths, bool is_dir) {
    static fs::path config_dir_local;
    static fs::path searched_from;
    static thread_local fs::path path;

    {
        static std::mutex mtx;
        std::lock_guard<std::mutex> lock(mtx);

        // search again if the process changed directory since the last lookup
        fs::path cwd = fs::current_path();
        if (config_dir_local.empty() || searched_from != cwd) {
            config_dir_local.clear();
            searched_from = cwd;
            for (
                fs::path dir = cwd, parent_dir = dir.parent_path();
                !dir.empty();
                dir = parent_dir, parent_dir = dir.parent_path()
            ) {
                fs::path coil_dir = dir / ".coil";
                if (fs::exists(coil_dir)) {
                    config_dir_local = coil_dir;
                    break;
                }
                if (dir == parent_dir) {
                    break;
                }
            }
            if (config_dir_local.empty()) {
                throw std::invalid_argument("Could not find .coil directory for project. Create one.");
            }
        }
        path = config_dir_local;
    }

    return path_helper(path, subpaths, is_dir);
}

std::string_view Configuration::path_user(std::span<std::string_view const> subpaths, bool is_dir) {
    static thread_local fs::path path;
    path = config_dir_user();
    return path_helper(path, subpaths, is_dir);
}

} // namespace coil
