#pragma once
#include "mcptool/tools/arguments.hpp"

#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <tuple>
#include <utility>
#include <vector>

namespace mcptool::tools
{

/// Key/value store shared by every call of a MemoryTool.
///
/// Each operation takes the lock for its own duration only.
class MemoryStore
{
  public:
    void store(const std::string& key, Json value);
    std::optional<Json> retrieve(const std::string& key) const;
    /// Keys in ascending order.
    std::vector<std::string> keys() const;
    /// Returns false if the key was not present.
    bool erase(const std::string& key);
    void clear();
    std::size_t size() const;

  private:
    mutable std::mutex mutex_;
    std::map<std::string, Json> entries_;
};

enum class MemoryAction
{
    Store,
    Retrieve,
    List,
    Delete,
    Clear
};

} // namespace mcptool::tools

namespace mcptool::util::schema_build
{
template <>
struct EnumNames<tools::MemoryAction>
{
    static const std::vector<std::pair<tools::MemoryAction, const char*>>& values();
};
} // namespace mcptool::util::schema_build

namespace mcptool::tools
{

/// Store, retrieve, list, delete and clear JSON values by key.
/// Missing keys and values are reported to the peer as isError results.
class MemoryTool
{
  public:
    static constexpr const char* kName = "memory";
    static constexpr const char* kDescription =
        "Store and retrieve JSON memories using string keys";

    struct Properties
    {
        MemoryAction action{MemoryAction::List};
        std::optional<std::string> key;
        std::optional<Json> value;

        static auto fields()
        {
            return std::make_tuple(
                field("action", &Properties::action,
                      "The action to perform: 'store' to save a value, 'retrieve' to get a "
                      "value, 'list' to see all keys, 'delete' to remove a key, or 'clear' to "
                      "remove all keys"),
                field("key", &Properties::key,
                      "The key to store/retrieve/delete the memory under (not required for "
                      "list/clear)"),
                field("value", &Properties::value,
                      "The JSON value to store (only required for store action)")
                    .with_schema(Json{{"type", Json::array({"object", "null"})}}));
        }
    };

    explicit MemoryTool(std::shared_ptr<MemoryStore> store);

    CallToolResult call(const Properties& args) const;

    const std::shared_ptr<MemoryStore>& store() const
    {
        return store_;
    }

  private:
    std::shared_ptr<MemoryStore> store_;
};

} // namespace mcptool::tools
