#include "walltint/reactor/theme_reactor.hpp"

#include <exception>
#include <utility>

#include "walltint/apply/theme_applier.hpp"
#include "walltint/cache/palette_cache.hpp"
#include "walltint/log.hpp"
#include "walltint/reactor/worker_pool.hpp"
#include "walltint/sampling/color_sampler.hpp"
#include "walltint/sampling/image_source.hpp"
#include "walltint/synthesis/palette_synthesizer.hpp"

namespace walltint::reactor
{

  std::string_view toString(OutputState s) noexcept
  {
    switch (s)
    {
    case OutputState::Idle:
      return "idle";
    case OutputState::Pending:
      return "pending";
    case OutputState::Computing:
      return "computing";
    case OutputState::Applying:
      return "applying";
    }
    return "unknown";
  }

  ThemeReactor::ThemeReactor(const ReactorConfig &cfg, cache::PaletteCache &cache,
                             const sampling::ImageSource &images, const sampling::ColorSampler &sampler,
                             const synthesis::PaletteSynthesizer &synthesizer, apply::ThemeApplier &applier,
                             WorkerPool &pool)
      : m_cfg(cfg),
        m_cache(cache),
        m_images(images),
        m_sampler(sampler),
        m_synth(synthesizer),
        m_applier(applier),
        m_pool(pool),
        m_mode(cfg.initialMode)
  {
  }

  ThemeReactor::~ThemeReactor()
  {
    stop();
  }

  void ThemeReactor::start()
  {
    std::lock_guard<std::mutex> lk(m_mtx);
    if (m_running)
      return;
    m_running = true;
    m_stopping = false;
    m_thread = std::thread([this]
                           { eventLoop(); });
  }

  void ThemeReactor::stop()
  {
    {
      std::lock_guard<std::mutex> lk(m_mtx);
      if (!m_running)
        return;
      m_stopping = true;
      m_wakeup = true;
    }
    m_cv.notify_all();
    if (m_thread.joinable())
      m_thread.join();

    std::lock_guard<std::mutex> lk(m_mtx);
    m_running = false;
  }

  // Notifies under the lock: once a worker's final event is consumed the reactor may be destroyed,
  // so the worker must not touch m_cv after releasing m_mtx.
  void ThemeReactor::push(Event ev)
  {
    std::lock_guard<std::mutex> lk(m_mtx);
    m_events.push_back(std::move(ev));
    m_cv.notify_one();
  }

  void ThemeReactor::notifyWallpaperChanged(const std::string &outputId, const std::string &imageRef)
  {
    Event ev;
    ev.kind = EventKind::Wallpaper;
    ev.outputId = outputId;
    ev.imageRef = imageRef;
    ev.identity = cache::WallpaperIdentity::fromPath(imageRef);
    push(std::move(ev));
  }

  void ThemeReactor::notifyModeChanged(Mode mode)
  {
    Event ev;
    ev.kind = EventKind::ModeChange;
    ev.mode = mode;
    push(std::move(ev));
  }

  void ThemeReactor::refresh(const std::string &outputId)
  {
    std::string imageRef;
    {
      std::lock_guard<std::mutex> lk(m_mtx);
      auto it = m_slots.find(outputId);
      if (it == m_slots.end() || it->second.imageRef.empty())
      {
        log::warn("ThemeReactor", "refresh: no wallpaper known for ", outputId);
        return;
      }
      imageRef = it->second.imageRef;
    }

    Event ev;
    ev.kind = EventKind::Refresh;
    ev.outputId = outputId;
    ev.imageRef = imageRef;
    ev.identity = cache::WallpaperIdentity::fromPath(imageRef);
    push(std::move(ev));
  }

  bool ThemeReactor::waitIdle(std::chrono::milliseconds timeout)
  {
    std::unique_lock<std::mutex> lk(m_mtx);
    return m_idleCv.wait_for(lk, timeout, [this]
                             { return m_events.empty() && !m_dispatching && m_inflight == 0 && allIdleLocked(); });
  }

  Mode ThemeReactor::mode() const
  {
    std::lock_guard<std::mutex> lk(m_mtx);
    return m_mode;
  }

  OutputState ThemeReactor::state(const std::string &outputId) const
  {
    std::lock_guard<std::mutex> lk(m_mtx);
    auto it = m_slots.find(outputId);
    return it == m_slots.end() ? OutputState::Idle : it->second.state;
  }

  ThemeReactor::ListenerID ThemeReactor::addListener(std::function<void(const Transition &)> fn)
  {
    std::lock_guard<std::mutex> lk(m_listenerMtx);
    const ListenerID id = m_nextListenerId++;
    m_listeners.emplace(id, std::move(fn));
    return id;
  }

  void ThemeReactor::removeListener(ListenerID id)
  {
    std::lock_guard<std::mutex> lk(m_listenerMtx);
    m_listeners.erase(id);
  }

  void ThemeReactor::notifyListeners(const Transitions &emitted)
  {
    if (emitted.empty())
      return;

    std::vector<std::function<void(const Transition &)>> fns;
    {
      std::lock_guard<std::mutex> lk(m_listenerMtx);
      fns.reserve(m_listeners.size());
      for (const auto &[id, fn] : m_listeners)
        fns.push_back(fn);
    }

    for (const Transition &t : emitted)
    {
      for (const auto &fn : fns)
      {
        if (fn)
          fn(t);
      }
    }
  }

  bool ThemeReactor::allIdleLocked() const
  {
    for (const auto &[id, slot] : m_slots)
    {
      if (slot.state != OutputState::Idle)
        return false;
    }
    return true;
  }

  std::optional<ThemeReactor::Clock::time_point> ThemeReactor::nextDeadline() const
  {
    std::optional<Clock::time_point> next;
    for (const auto &[id, slot] : m_slots)
    {
      if (slot.state == OutputState::Pending && (!next || slot.deadline < *next))
        next = slot.deadline;
    }
    return next;
  }

  void ThemeReactor::eventLoop()
  {
    std::unique_lock<std::mutex> lk(m_mtx);
    for (;;)
    {
      Transitions emitted;
      Jobs jobs;

      while (!m_events.empty())
      {
        Event ev = std::move(m_events.front());
        m_events.pop_front();
        handle(ev, Clock::now(), emitted, jobs);
      }

      if (m_stopping)
        dropPending(emitted);
      else
        fireDue(Clock::now(), emitted, jobs);

      if (!emitted.empty() || !jobs.empty())
      {
        m_dispatching = true;
        lk.unlock();

        notifyListeners(emitted);
        for (auto &job : jobs)
        {
          // A pool that is already shutting down cannot take the job; run it here so the
          // output still completes its cycle.
          if (!m_pool.post(job))
            job();
        }

        lk.lock();
        m_dispatching = false;
        continue;
      }

      m_idleCv.notify_all();
      if (m_stopping && m_inflight == 0 && m_events.empty())
        break;

      m_wakeup = false;
      const auto wake = [this]
      { return !m_events.empty() || m_wakeup; };
      if (const auto next = nextDeadline())
        m_cv.wait_until(lk, *next, wake);
      else
        m_cv.wait(lk, wake);
    }
    m_idleCv.notify_all();
  }

  void ThemeReactor::handle(Event &ev, Clock::time_point now, Transitions &emitted, Jobs &jobs)
  {
    switch (ev.kind)
    {
    case EventKind::Wallpaper:
    case EventKind::Refresh:
    {
      if (m_stopping || !ev.identity)
        return;
      Slot &slot = m_slots[ev.outputId];
      slot.imageRef = ev.imageRef;
      slot.identity = ev.identity;
      log::debug("ThemeReactor", ev.outputId, ": wallpaper ", ev.imageRef);
      retarget(ev.outputId, slot, Target{cache::ThemeKey{*ev.identity, m_mode}, ev.imageRef}, now, emitted);
      return;
    }

    case EventKind::ModeChange:
    {
      if (m_mode != ev.mode)
        log::info("ThemeReactor", "mode -> ", toString(ev.mode));
      m_mode = ev.mode;
      if (m_stopping)
        return;
      for (auto &[outputId, slot] : m_slots)
      {
        if (!slot.identity)
          continue;
        retarget(outputId, slot, Target{cache::ThemeKey{*slot.identity, m_mode}, slot.imageRef}, now, emitted);
      }
      return;
    }

    case EventKind::ComputeDone:
    {
      --m_inflight;
      auto it = m_slots.find(ev.outputId);
      if (it == m_slots.end())
        return;
      Slot &slot = it->second;

      if (m_stopping)
      {
        slot.active.reset();
        slot.queued.reset();
        setState(ev.outputId, slot, OutputState::Idle, emitted);
        return;
      }

      if (slot.queued && slot.active && !(slot.queued->key == slot.active->key))
      {
        log::info("ThemeReactor", ev.outputId, ": discarding superseded palette");
        promoteQueued(ev.outputId, slot, emitted);
        return;
      }
      // Re-requesting the key that was just computed changes nothing.
      slot.queued.reset();
      startApply(ev.outputId, slot, ev.result.palette, jobs, emitted);
      return;
    }

    case EventKind::ApplyDone:
    {
      --m_inflight;
      auto it = m_slots.find(ev.outputId);
      if (it == m_slots.end())
        return;
      Slot &slot = it->second;
      if (slot.queued && !m_stopping)
      {
        promoteQueued(ev.outputId, slot, emitted);
        return;
      }
      slot.queued.reset();
      setState(ev.outputId, slot, OutputState::Idle, emitted);
      slot.active.reset();
      return;
    }
    }
  }

  void ThemeReactor::setState(const std::string &outputId, Slot &slot, OutputState to, Transitions &emitted)
  {
    Transition t;
    t.outputId = outputId;
    t.from = slot.state;
    t.to = to;
    if (to == OutputState::Pending && slot.pending)
      t.key = slot.pending->key;
    else if (slot.active)
      t.key = slot.active->key;

    slot.state = to;
    emitted.push_back(std::move(t));
  }

  void ThemeReactor::retarget(const std::string &outputId, Slot &slot, Target target, Clock::time_point now,
                              Transitions &emitted)
  {
    switch (slot.state)
    {
    case OutputState::Idle:
      slot.pending = std::move(target);
      slot.deadline = now + m_cfg.debounce;
      setState(outputId, slot, OutputState::Pending, emitted);
      return;

    case OutputState::Pending:
    {
      const bool sameKey = slot.pending && slot.pending->key == target.key;
      slot.pending = std::move(target);
      slot.deadline = now + m_cfg.debounce;
      if (!sameKey)
        setState(outputId, slot, OutputState::Pending, emitted);
      return;
    }

    case OutputState::Computing:
    case OutputState::Applying:
      slot.queued = std::move(target);
      slot.queuedDeadline = now + m_cfg.debounce;
      return;
    }
  }

  void ThemeReactor::promoteQueued(const std::string &outputId, Slot &slot, Transitions &emitted)
  {
    slot.pending = std::move(slot.queued);
    slot.queued.reset();
    slot.deadline = slot.queuedDeadline;
    slot.active.reset();
    setState(outputId, slot, OutputState::Pending, emitted);
  }

  void ThemeReactor::fireDue(Clock::time_point now, Transitions &emitted, Jobs &jobs)
  {
    for (auto &[outputId, slot] : m_slots)
    {
      if (slot.state == OutputState::Pending && slot.deadline <= now)
        startCompute(outputId, slot, emitted, jobs);
    }
  }

  void ThemeReactor::dropPending(Transitions &emitted)
  {
    for (auto &[outputId, slot] : m_slots)
    {
      if (slot.state != OutputState::Pending)
        continue;
      slot.pending.reset();
      setState(outputId, slot, OutputState::Idle, emitted);
    }
  }

  void ThemeReactor::startCompute(const std::string &outputId, Slot &slot, Transitions &emitted, Jobs &jobs)
  {
    slot.active = std::move(slot.pending);
    slot.pending.reset();
    setState(outputId, slot, OutputState::Computing, emitted);
    ++m_inflight;

    const Target target = *slot.active;
    jobs.push_back([this, outputId, target]
                   {
      ComputeResult result;
      try
      {
        result = compute(target);
      }
      catch (const std::exception &e)
      {
        log::error("ThemeReactor", outputId, ": palette job threw: ", e.what(), ", using the default ",
                   toString(target.key.mode), " palette");
        result = ComputeResult{};
        result.palette = synthesis::PaletteSynthesizer::fallback(target.key.mode);
      }

      Event ev;
      ev.kind = EventKind::ComputeDone;
      ev.outputId = outputId;
      ev.result = result;
      push(std::move(ev)); });
  }

  void ThemeReactor::startApply(const std::string &outputId, Slot &slot, const color::SemanticPalette &palette,
                                Jobs &jobs, Transitions &emitted)
  {
    setState(outputId, slot, OutputState::Applying, emitted);
    ++m_inflight;

    const Mode mode = slot.active ? slot.active->key.mode : m_mode;
    jobs.push_back([this, outputId, mode, palette]
                   {
      std::string err;
      bool ok = false;
      try
      {
        ok = m_applier.apply(outputId, mode, palette, &err);
      }
      catch (const std::exception &e)
      {
        err = e.what();
      }
      if (!ok)
        log::warn("ThemeReactor", outputId, ": ", toString(ErrorCode::ApplyFailed), ": ", err);

      Event ev;
      ev.kind = EventKind::ApplyDone;
      ev.outputId = outputId;
      push(std::move(ev)); });
  }

  ThemeReactor::ComputeResult ThemeReactor::compute(const Target &target) const
  {
    const cache::WallpaperIdentity &id = target.key.identity;
    const Mode mode = target.key.mode;

    if (auto hit = m_cache.get(id, mode))
    {
      log::info("ThemeReactor", "cache hit for ", id.key(), " (", toString(mode), ")");
      return ComputeResult{*hit, true, ErrorCode::None};
    }

    ErrorCode err = ErrorCode::None;
    auto samples = m_sampler.sampleFile(m_images, target.imageRef, &err);
    if (!samples)
    {
      log::warn("ThemeReactor", target.imageRef, ": ", toString(err), ", using the default ", toString(mode),
                " palette");
      return ComputeResult{synthesis::PaletteSynthesizer::fallback(mode), false, err};
    }

    auto palette = m_synth.synthesize(*samples, mode, &err);
    if (!palette)
    {
      log::warn("ThemeReactor", target.imageRef, ": ", toString(err), ", using the default ", toString(mode),
                " palette");
      return ComputeResult{synthesis::PaletteSynthesizer::fallback(mode), false, err};
    }

    ComputeResult result{*palette, false, ErrorCode::None};
    if (!m_cache.put(id, mode, *palette, &err))
      result.error = err; // still applied

    if (m_cfg.prewarmOtherMode && !m_cache.contains(id, ~mode))
    {
      if (auto other = m_synth.synthesize(*samples, ~mode))
      {
        ErrorCode otherErr = ErrorCode::None;
        if (!m_cache.put(id, ~mode, *other, &otherErr))
          log::debug("ThemeReactor", "prewarm of ", toString(~mode), " failed: ", toString(otherErr));
      }
    }

    log::info("ThemeReactor", "synthesized ", toString(mode), " palette for ", id.key());
    return result;
  }

} // namespace walltint::reactor
