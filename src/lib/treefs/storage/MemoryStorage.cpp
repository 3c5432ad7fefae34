
#include <nlohmann/json.hpp>

#include "MemoryStorage.hpp"
#include "treefs/StringUtil.hpp"

namespace TreeFS {
namespace Storage {

/** Lists a memory folder by re-reading it on every Next() */
class MemoryStorage::Reader : public BaseStorage::EntryReader
{
public:
    Reader(const MemoryStorage& storage, std::string path) :
        mStorage(storage), mPath(std::move(path)) { }

    bool Next(Entry& entry) override
    {
        const std::lock_guard<std::mutex> lock(mStorage.mMutex);

        const MemoryNode& folder { mStorage.Find(mPath, EntryType::FOLDER) };

        // continue after the last name so concurrent changes don't invalidate us
        const decltype(folder.children)::const_iterator it { mStarted ?
            folder.children.upper_bound(mLast) : folder.children.cbegin() };
        if (it == folder.children.cend()) return false;

        mStarted = true;
        mLast = it->first;

        entry.name = it->first;
        entry.type = it->second->type;
        return true;
    }

private:
    const MemoryStorage& mStorage;
    const std::string mPath;

    /** true if at least one entry was returned */
    bool mStarted { false };
    /** the name of the last entry returned */
    std::string mLast;
};

/*****************************************************/
MemoryStorage::MemoryStorage(const StorageOptions& options) :
    BaseStorage(options),
    mRoot(std::make_unique<MemoryNode>(EntryType::FOLDER)),
    mDebug(__func__,this)
{
    MDBG_INFO("()");
}

/*****************************************************/
MemoryStorage::MemoryStorage(const nlohmann::json& tree, const StorageOptions& options) :
    MemoryStorage(options)
{
    LoadNode(*mRoot, tree);
}

/*****************************************************/
MemoryStorage::~MemoryStorage()
{
    MDBG_INFO("()");
}

/*****************************************************/
MemoryStorage::MemoryNode* MemoryStorage::TryFind(const std::string& path) const
{
    MemoryNode* node { mRoot.get() };

    for (const std::string& name : StringUtil::explode(path,"/"))
    {
        if (name.empty()) continue; // leading /
        if (node->type != EntryType::FOLDER) return nullptr;

        const decltype(node->children)::const_iterator it { node->children.find(name) };
        if (it == node->children.cend()) return nullptr;
        node = it->second.get();
    }

    return node;
}

/*****************************************************/
MemoryStorage::MemoryNode& MemoryStorage::Find(const std::string& path, const EntryType type) const
{
    MemoryNode* node { TryFind(path) };
    if (node == nullptr || node->type != type)
        throw NotFoundException(path);
    return *node;
}

/*****************************************************/
MemoryStorage::MemoryNode& MemoryStorage::FindParent(const std::string& path, std::string& name) const
{
    const StringUtil::StringPair pair { StringUtil::splitPath(path) };
    if (pair.second.empty()) throw IOException("no parent: "+path);

    name = pair.second;
    return Find(pair.first, EntryType::FOLDER);
}

/*****************************************************/
BaseStorage::EntryType MemoryStorage::GetEntryType(const std::string& path)
{
    MDBG_STORAGE("(path:" << path << ")");

    const std::lock_guard<std::mutex> lock(mMutex);

    const MemoryNode* node { TryFind(path) };
    return (node != nullptr) ? node->type : EntryType::NONE;
}

/*****************************************************/
std::unique_ptr<BaseStorage::EntryReader> MemoryStorage::ListFolder(const std::string& path)
{
    MDBG_STORAGE("(path:" << path << ")");

    return std::make_unique<Reader>(*this, path);
}

/*****************************************************/
void MemoryStorage::CreateFolder(const std::string& path)
{
    MDBG_STORAGE("(path:" << path << ")");

    const std::lock_guard<std::mutex> lock(mMutex);

    std::string name; MemoryNode& parent { FindParent(path, name) };

    const decltype(parent.children)::const_iterator it { parent.children.find(name) };
    if (it != parent.children.cend())
    {
        if (it->second->type == EntryType::FOLDER) return;
        throw IOException("file exists: "+path);
    }

    parent.children.emplace(name, std::make_unique<MemoryNode>(EntryType::FOLDER));
}

/*****************************************************/
void MemoryStorage::CreateFile(const std::string& path)
{
    MDBG_STORAGE("(path:" << path << ")");

    const std::lock_guard<std::mutex> lock(mMutex);

    std::string name; MemoryNode& parent { FindParent(path, name) };

    const decltype(parent.children)::const_iterator it { parent.children.find(name) };
    if (it != parent.children.cend())
    {
        if (it->second->type == EntryType::FILE) return;
        throw IOException("folder exists: "+path);
    }

    parent.children.emplace(name, std::make_unique<MemoryNode>(EntryType::FILE));
}

/*****************************************************/
void MemoryStorage::DeleteFile(const std::string& path)
{
    MDBG_STORAGE("(path:" << path << ")");

    const std::lock_guard<std::mutex> lock(mMutex);

    std::string name; MemoryNode& parent { FindParent(path, name) };

    const decltype(parent.children)::const_iterator it { parent.children.find(name) };
    if (it == parent.children.cend() || it->second->type != EntryType::FILE)
        throw NotFoundException(path);

    parent.children.erase(it);
}

/*****************************************************/
void MemoryStorage::DeleteFolder(const std::string& path)
{
    MDBG_STORAGE("(path:" << path << ")");

    const std::lock_guard<std::mutex> lock(mMutex);

    std::string name; MemoryNode& parent { FindParent(path, name) };

    const decltype(parent.children)::const_iterator it { parent.children.find(name) };
    if (it == parent.children.cend() || it->second->type != EntryType::FOLDER)
        throw NotFoundException(path);

    if (!it->second->children.empty())
        throw IOException("folder not empty: "+path);

    parent.children.erase(it);
}

/*****************************************************/
void MemoryStorage::CopyFile(const std::string& src, const std::string& dst)
{
    MDBG_STORAGE("(src:" << src << " dst:" << dst << ")");

    const std::lock_guard<std::mutex> lock(mMutex);

    const MemoryNode& srcNode { Find(src, EntryType::FILE) };

    std::string name; MemoryNode& parent { FindParent(dst, name) };

    std::unique_ptr<MemoryNode>& dstNode { parent.children[name] };
    if (dstNode && dstNode->type != EntryType::FILE)
        throw IOException("folder exists: "+dst);

    if (!dstNode) dstNode = std::make_unique<MemoryNode>(EntryType::FILE);
    dstNode->data = srcNode.data;
}

/*****************************************************/
std::string MemoryStorage::ReadFile(const std::string& path)
{
    MDBG_STORAGE("(path:" << path << ")");

    const std::lock_guard<std::mutex> lock(mMutex);

    return Find(path, EntryType::FILE).data;
}

/*****************************************************/
void MemoryStorage::WriteFile(const std::string& path, const std::string& data)
{
    MDBG_STORAGE("(path:" << path << " size:" << data.size() << ")");

    const std::lock_guard<std::mutex> lock(mMutex);

    std::string name; MemoryNode& parent { FindParent(path, name) };

    std::unique_ptr<MemoryNode>& node { parent.children[name] };
    if (node && node->type != EntryType::FILE)
        throw IOException("folder exists: "+path);

    if (!node) node = std::make_unique<MemoryNode>(EntryType::FILE);
    node->data = data;
}

/*****************************************************/
bool MemoryStorage::TryRename(const std::string& src, const std::string& dst)
{
    MDBG_STORAGE("(src:" << src << " dst:" << dst << ")");

    const std::lock_guard<std::mutex> lock(mMutex);

    std::string srcName; MemoryNode& srcParent { FindParent(src, srcName) };
    std::string dstName; MemoryNode& dstParent { FindParent(dst, dstName) };

    const decltype(srcParent.children)::iterator srcIt { srcParent.children.find(srcName) };
    if (srcIt == srcParent.children.end()) throw NotFoundException(src);

    if (dstParent.children.count(dstName) != 0)
        throw IOException("target exists: "+dst);

    // a folder cannot be moved into itself
    if (srcIt->second->type == EntryType::FOLDER &&
        StringUtil::startsWith(dst+"/", src+"/"))
        throw IOException("target inside source: "+dst);

    std::unique_ptr<MemoryNode> node { std::move(srcIt->second) };
    srcParent.children.erase(srcIt);
    dstParent.children.emplace(dstName, std::move(node));
    return true;
}

/*****************************************************/
void MemoryStorage::SetCreationTime(const std::string& path, const Clock::time_point& time)
{
    MDBG_STORAGE("(path:" << path << ")");

    const std::lock_guard<std::mutex> lock(mMutex);

    MemoryNode* node { TryFind(path) };
    if (node == nullptr) throw NotFoundException(path);
    node->created = time;
}

/*****************************************************/
std::optional<BaseStorage::Clock::time_point> MemoryStorage::GetCreationTime(const std::string& path) const
{
    const std::lock_guard<std::mutex> lock(mMutex);

    const MemoryNode* node { TryFind(path) };
    if (node == nullptr) throw NotFoundException(path);
    return node->created;
}

/*****************************************************/
void MemoryStorage::LoadJSON(const nlohmann::json& tree, const std::string& path)
{
    MDBG_INFO("(path:" << path << ")");

    MemoryNode loaded(EntryType::FOLDER);
    LoadNode(loaded, tree); // parse before touching the tree

    const std::lock_guard<std::mutex> lock(mMutex);

    MemoryNode& folder { Find(path, EntryType::FOLDER) };
    folder.children = std::move(loaded.children);
}

/*****************************************************/
nlohmann::json MemoryStorage::DumpJSON(const std::string& path) const
{
    const std::lock_guard<std::mutex> lock(mMutex);

    const MemoryNode* node { TryFind(path) };
    if (node == nullptr) throw NotFoundException(path);
    return DumpNode(*node);
}

/*****************************************************/
void MemoryStorage::LoadNode(MemoryNode& folder, const nlohmann::json& tree)
{
    if (!tree.is_object())
        throw FormatException("folder must be an object");

    for (const auto& it : tree.items())
    {
        const std::string& name { it.key() };
        if (name.empty() || name == "." || name == ".." || name.find('/') != std::string::npos)
            throw FormatException("invalid name: "+name);

        const nlohmann::json& value { it.value() };
        if (value.is_string())
        {
            std::unique_ptr<MemoryNode> file { std::make_unique<MemoryNode>(EntryType::FILE) };
            value.get_to(file->data);
            folder.children.emplace(name, std::move(file));
        }
        else
        {
            std::unique_ptr<MemoryNode> child { std::make_unique<MemoryNode>(EntryType::FOLDER) };
            LoadNode(*child, value);
            folder.children.emplace(name, std::move(child));
        }
    }
}

/*****************************************************/
nlohmann::json MemoryStorage::DumpNode(const MemoryNode& node)
{
    if (node.type == EntryType::FILE) return node.data;

    nlohmann::json retval(nlohmann::json::value_t::object);
    for (const decltype(node.children)::value_type& child : node.children)
        retval[child.first] = DumpNode(*child.second);
    return retval;
}

} // namespace Storage
} // namespace TreeFS
