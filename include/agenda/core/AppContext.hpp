#pragma once

#include <memory>

#include "agenda/core/Settings.hpp"

namespace agenda {
namespace data {
class DataProvider;
class EventRepository;
}

namespace core {

class SyncRunner;

class AppContext
{
public:
    explicit AppContext(Settings settings);
    ~AppContext();

    const Settings &settings() const;
    data::EventRepository &eventRepository();
    SyncRunner &syncRunner();

private:
    Settings m_settings;
    std::unique_ptr<data::DataProvider> m_dataProvider;
    std::unique_ptr<SyncRunner> m_syncRunner;
};

} // namespace core
} // namespace agenda
