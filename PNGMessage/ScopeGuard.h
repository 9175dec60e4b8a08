#pragma once

#include <utility>

namespace PNGMessage
{
    //Runs the lambda when the scope ends unless Disengage() was called first
    template<class Lambda>
    class ScopeGuard
    {
    private:
        Lambda m_l;
        bool m_engaged = true;

    public:
        ScopeGuard(Lambda l) :
            m_l(std::move(l))
        {
        }
        ScopeGuard(const ScopeGuard&) = delete;
        ScopeGuard(ScopeGuard&&) = delete;
        ~ScopeGuard()
        {
            if(m_engaged)
                m_l();
        }

        ScopeGuard& operator=(const ScopeGuard&) = delete;
        ScopeGuard& operator=(ScopeGuard&&) = delete;

    public:
        void Disengage() noexcept { m_engaged = false; }
    };
}
