#include "mcptool/tools/memory.hpp"

#include "mcptool/exceptions.hpp"
#include "mcptool/logging.hpp"
#include "mcptool/util/json.hpp"

namespace mcptool::util::schema_build
{
const std::vector<std::pair<tools::MemoryAction, const char*>>&
EnumNames<tools::MemoryAction>::values()
{
    static const std::vector<std::pair<tools::MemoryAction, const char*>> names = {
        {tools::MemoryAction::Store, "store"},
        {tools::MemoryAction::Retrieve, "retrieve"},
        {tools::MemoryAction::List, "list"},
        {tools::MemoryAction::Delete, "delete"},
        {tools::MemoryAction::Clear, "clear"},
    };
    return names;
}
} // namespace mcptool::util::schema_build

namespace mcptool::tools
{

void MemoryStore::store(const std::string& key, Json value)
{
    std::lock_guard<std::mutex> lock(mutex_);
    entries_[key] = std::move(value);
}

std::optional<Json> MemoryStore::retrieve(const std::string& key) const
{
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = entries_.find(key);
    if (it == entries_.end())
        return std::nullopt;
    return it->second;
}

std::vector<std::string> MemoryStore::keys() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::string> out;
    out.reserve(entries_.size());
    for (const auto& kv : entries_)
        out.push_back(kv.first);
    return out;
}

bool MemoryStore::erase(const std::string& key)
{
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_.erase(key) > 0;
}

void MemoryStore::clear()
{
    std::lock_guard<std::mutex> lock(mutex_);
    entries_.clear();
}

std::size_t MemoryStore::size() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_.size();
}

MemoryTool::MemoryTool(std::shared_ptr<MemoryStore> store) : store_(std::move(store))
{
    if (!store_)
        throw ValidationError("memory tool requires a store");
}

CallToolResult MemoryTool::call(const Properties& args) const
{
    switch (args.action)
    {
    case MemoryAction::Store:
    {
        if (!args.key)
            return CallToolResult::error("Key is required for store action");
        if (!args.value)
            return CallToolResult::error("Value is required for store action");
        store_->store(*args.key, *args.value);
        logging::debug("memory", "stored key " + *args.key);
        return CallToolResult::success("Successfully stored memory with key: " + *args.key);
    }
    case MemoryAction::Retrieve:
    {
        if (!args.key)
            return CallToolResult::error("Key is required for retrieve action");
        auto value = store_->retrieve(*args.key);
        if (!value)
            return CallToolResult::success("No memory found for key: " + *args.key);
        return CallToolResult::success(util::json::dump_pretty(*value));
    }
    case MemoryAction::List:
        return CallToolResult::success(util::json::dump_pretty(Json(store_->keys())));
    case MemoryAction::Delete:
    {
        if (!args.key)
            return CallToolResult::error("Key is required for delete action");
        if (!store_->erase(*args.key))
            return CallToolResult::success("No memory found to delete for key: " + *args.key);
        return CallToolResult::success("Successfully deleted memory with key: " + *args.key);
    }
    case MemoryAction::Clear:
        store_->clear();
        return CallToolResult::success("Successfully cleared all memories");
    }
    throw ToolExecutionError("unhandled memory action");
}

} // namespace mcptool::tools
