/**
 * @file hook/hook_context.cpp
 * @brief HookContext implementation: worker startup handshake and teardown.
 */

#include "hook/hook_context.hpp"

#include <exception>
#include <system_error>

#include <hookwatch/log.hpp>

#include "hook/event_channel.hpp"

namespace hookwatch::detail {

std::shared_ptr<HookContext> HookContext::launch(HookKind kind, HookApi &api) {
  auto ctx = std::make_shared<HookContext>(kind, api);
  ctx->start();
  return ctx;
}

std::shared_ptr<HookContext> HookContext::create(HookKind kind, HookApi &api) {
  auto ctx = launch(kind, api);
  ctx->waitUntilReady();
  return ctx;
}

HookContext::HookContext(HookKind kind, HookApi &api)
    : m_kind(kind), m_api(api), m_raw(std::make_shared<RawHook>()),
      m_startup(std::make_shared<Startup>()) {
  // Open before the worker exists so the first callback already has a sender.
  EventChannel::instance().openSender(m_kind);
}

HookContext::~HookContext() {
  retireWorker();
  EventChannel::instance().closeSender(m_kind);
}

void HookContext::start() {
  try {
    m_worker = std::thread(&HookContext::threadMain, m_kind, &m_api, m_raw,
                           m_startup);
  } catch (const std::system_error &e) {
    HOOKWATCH_LOG_ERROR("HookContext: cannot start %s hook thread: %s",
                        toString(m_kind), e.what());
    signalReady(*m_startup, 0, false);
  }
}

void HookContext::waitUntilReady() const {
  std::unique_lock<std::mutex> lk(m_startup->mutex);
  m_startup->cv.wait(lk, [this] { return m_startup->ready; });
}

bool HookContext::isInstalled() const { return m_raw->isSet(); }

void HookContext::signalReady(Startup &startup, uint32_t threadId,
                              bool installed) {
  {
    std::lock_guard<std::mutex> lk(startup.mutex);
    startup.threadId = threadId;
    startup.installed = installed;
    startup.ready = true;
  }
  startup.cv.notify_all();
}

void HookContext::threadMain(HookKind kind, HookApi *api,
                             std::shared_ptr<RawHook> raw,
                             std::shared_ptr<Startup> startup) {
  HookToken token = nullptr;
  bool stored = false;
  try {
    const uint32_t threadId = api->currentThreadId();
    token = api->install(kind);
    if (token != nullptr) {
      raw->set(token);
      stored = true;
    }
    signalReady(*startup, threadId, stored);
  } catch (const std::exception &e) {
    HOOKWATCH_LOG_ERROR("HookContext: %s hook startup failed: %s",
                        toString(kind), e.what());
    // Nobody else can unregister a token that never reached the RawHook.
    if (token != nullptr && !stored && !api->uninstall(token))
      HOOKWATCH_LOG_WARN("HookContext: orphaned %s hook could not be removed",
                         toString(kind));
    signalReady(*startup, 0, false);
    return;
  }

  if (token == nullptr) {
    HOOKWATCH_LOG_ERROR("HookContext: registering the %s hook failed; no "
                        "events will be delivered",
                        toString(kind));
    return;
  }

  HOOKWATCH_LOG_INFO("HookContext: %s hook installed", toString(kind));
  // Parks here for the lifetime of the hook; a quit message ends it.
  api->runMessageLoop();
  HOOKWATCH_LOG_DEBUG("HookContext: %s hook worker left its message loop",
                      toString(kind));
}

void HookContext::retireWorker() noexcept {
  bool installed = false;
  uint32_t threadId = 0;
  try {
    std::unique_lock<std::mutex> lk(m_startup->mutex);
    m_startup->cv.wait(lk, [this] { return m_startup->ready; });
    installed = m_startup->installed;
    threadId = m_startup->threadId;
  } catch (const std::system_error &e) {
    HOOKWATCH_LOG_WARN("HookContext: %s startup state unavailable: %s",
                       toString(m_kind), e.what());
  }

  if (m_raw->release(m_api))
    HOOKWATCH_LOG_INFO("HookContext: %s hook unregistered", toString(m_kind));

  if (!m_worker.joinable())
    return;

  if (m_worker.get_id() == std::this_thread::get_id()) {
    m_worker.detach();
    return;
  }

  if (installed && !m_api.postQuit(threadId)) {
    HOOKWATCH_LOG_WARN("HookContext: cannot wake the %s hook worker; leaving "
                       "it parked",
                       toString(m_kind));
    m_worker.detach();
    return;
  }

  try {
    m_worker.join();
  } catch (const std::system_error &e) {
    HOOKWATCH_LOG_WARN("HookContext: joining the %s hook worker failed: %s",
                       toString(m_kind), e.what());
  }
}

} // namespace hookwatch::detail
