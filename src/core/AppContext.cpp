#include "agenda/core/AppContext.hpp"

#include "agenda/data/DataProvider.hpp"

#include "agenda/core/SyncRunner.hpp"

#include <utility>

namespace agenda {
namespace core {

AppContext::AppContext(Settings settings)
    : m_settings(std::move(settings))
    , m_dataProvider(std::make_unique<data::DataProvider>(m_settings.calendarsPath))
    , m_syncRunner(std::make_unique<SyncRunner>(m_settings.syncProgram, m_settings.syncArguments))
{
}

AppContext::~AppContext() = default;

const Settings &AppContext::settings() const
{
    return m_settings;
}

data::EventRepository &AppContext::eventRepository()
{
    return m_dataProvider->eventRepository();
}

SyncRunner &AppContext::syncRunner()
{
    return *m_syncRunner;
}

} // namespace core
} // namespace agenda
