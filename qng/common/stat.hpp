#pragma once

#include <array>
#include <atomic>
#include <mutex>
#include <string>
#include <type_traits>
#include <vector>

#include <qng/common/util.hpp>
#include <qng/common/errors.hpp>

namespace qng
{
template <typename KeyType>
class StatResult
{
public:
    KeyType index_;
    uint64_t count_;
    std::vector<std::string> details_;
};

class StatEntry
{
public:
    StatEntry();
    void Add(uint64_t, const std::string&);
    uint64_t Get() const;
    void Get(uint64_t&, std::vector<std::string>&) const;
    void Reset();

    static size_t constexpr MAX_DETAILS = 10;

private:
    std::atomic<uint64_t> count_;
    mutable std::mutex mutex_;
    uint64_t index_;
    std::vector<std::string> details_;
};

// Counter per enum value, keeps the latest MAX_DETAILS details of each
template <class KeyType,
          class = typename std::enable_if<std::is_enum<KeyType>::value>::type>
class Stat
{
public:
    void Add(KeyType key, uint64_t value, const std::string& str)
    {
        if (key >= KeyType::MAX)
        {
            return;
        }
        entries_[static_cast<size_t>(key)].Add(value, str);
    }

    uint64_t Get(KeyType key) const
    {
        if (key >= KeyType::MAX)
        {
            return 0;
        }
        return entries_[static_cast<size_t>(key)].Get();
    }

    void Get(KeyType key, uint64_t& value,
             std::vector<std::string>& details) const
    {
        if (key >= KeyType::MAX)
        {
            value = 0;
            details.clear();
            return;
        }
        entries_[static_cast<size_t>(key)].Get(value, details);
    }

    void Reset(KeyType key)
    {
        if (key >= KeyType::MAX)
        {
            return;
        }
        entries_[static_cast<size_t>(key)].Reset();
    }

    std::vector<qng::StatResult<KeyType>> GetAll() const
    {
        std::vector<qng::StatResult<KeyType>> result;
        for (size_t index = 0; index < entries_.size(); ++index)
        {
            qng::StatResult<KeyType> stat;
            stat.index_ = static_cast<KeyType>(index);
            entries_[index].Get(stat.count_, stat.details_);
            if (stat.count_ > 0 || !stat.details_.empty())
            {
                result.push_back(stat);
            }
        }
        return result;
    }

private:
    std::array<qng::StatEntry, static_cast<size_t>(KeyType::MAX)> entries_;
};

class Stats
{
public:
    Stats() = delete;

    static void Add(qng::ErrorCode);
    static void Add(const qng::Error&);
    template <typename... Args>
    static void Add(qng::ErrorCode error_code, Args... args)
    {
        error_.Add(error_code, 1, qng::ToString(args...));
    }
    static uint64_t Get(qng::ErrorCode);
    static std::vector<qng::StatResult<qng::ErrorCode>> GetAll();
    static void Reset(qng::ErrorCode);
    static void SerializeJson(qng::Json&);

    static qng::Stat<qng::ErrorCode> error_;
};

}  // namespace qng
