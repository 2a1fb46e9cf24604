/*//////////////////////////////////////////////////////////////////////////////
    Copyright (c) 2014-2026 Jamboree

    Distributed under the Boost Software License, Version 1.0. (See accompanying
    file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//////////////////////////////////////////////////////////////////////////////*/
#ifndef TAGSMITH_DETAIL_FN_HPP_INCLUDED
#define TAGSMITH_DETAIL_FN_HPP_INCLUDED

#include <version>
#include <cstddef>
#include <concepts>
#include <iterator>
#include <string_view>
#include <utility>
#ifdef TAGSMITH_USE_FMT
#include <fmt/format.h>
#elif defined(__cpp_lib_format)
#include <format>
#else
#error "format is not supported"
#endif

#if defined(_WIN32)
#   ifdef TAGSMITH_EXPORT
#       define TAGSMITH_API __declspec(dllexport)
#   elif defined(TAGSMITH_SHARED)
#       define TAGSMITH_API __declspec(dllimport)
#   endif
#endif
#ifndef TAGSMITH_API
#   define TAGSMITH_API
#endif

namespace tagsmith::detail
{
#ifdef TAGSMITH_USE_FMT
    namespace fmt = ::fmt;
#else
    namespace fmt = ::std;
#endif

    template<class T>
    inline T const& deref_data(void const* p)
    {
        return *static_cast<T const*>(p);
    }

    template<class>
    struct fn_base;

    template<class R, class... T>
    struct fn_base<R(T...)>
    {
        fn_base() noexcept : _data(), _call() {}

        template<class F>
        fn_base(F const& f) noexcept : _data(&f), _call(call<F>) {}

        template<class F>
        fn_base(F* f) noexcept : _data(reinterpret_cast<void const*>(f)), _call(call_fp<F>) {}

        R operator()(T... t) const
        {
            return _call(_data, std::forward<T>(t)...);
        }

        template<class F>
        static R call(void const* f, T&&... t)
        {
            return deref_data<F>(f)(std::forward<T>(t)...);
        }

        template<class F>
        static R call_fp(void const* f, T&&... t)
        {
            return reinterpret_cast<F*>(const_cast<void*>(f))(std::forward<T>(t)...);
        }

        void const* _data;
        R(*_call)(void const*, T&&...);
    };
}

namespace tagsmith
{
    template<class F, class R, class... T>
    concept Callable = requires(F const& f, T... t)
    {
        {f(t...)} -> std::convertible_to<R>;
    };

    template<class>
    class fn_ref;

    template<class R, class... T>
    class fn_ref<R(T...)> : detail::fn_base<R(T...)>
    {
        using base_t = detail::fn_base<R(T...)>;

    public:
        template<Callable<R, T...> F>
        fn_ref(F const& f) noexcept : base_t(f) {}

        using base_t::operator();
    };

    template<class>
    class fn_ptr;

    template<class R, class... T>
    class fn_ptr<R(T...)> : detail::fn_base<R(T...)>
    {
        using base_t = detail::fn_base<R(T...)>;

    public:
        fn_ptr() = default;
        fn_ptr(std::nullptr_t) noexcept {}

        template<Callable<R, T...> F>
        fn_ptr(F const& f) noexcept : base_t(f) {}

        using base_t::operator();

        explicit operator bool() const { return !!this->_data; }
    };

    using output_handler = fn_ref<void(char const*, std::size_t)>;
}

namespace tagsmith::detail
{
    struct output_buffer
    {
        using value_type = char;

        explicit output_buffer(output_handler os) : os(os) {}

        void push_back(char c)
        {
            if (count == sizeof(buf)) [[unlikely]]
            {
                flush();
                count = 0;
            }
            buf[count++] = c;
        }

        void flush() { os(buf, count); }

        std::size_t count = 0;
        char buf[1024];
        output_handler os;
    };

    template<class... Args>
    void print(output_handler os, fmt::format_string<Args...> spec, Args&&... args)
    {
        output_buffer buf(os);
        fmt::format_to(std::back_inserter(buf), spec, std::forward<Args>(args)...);
        buf.flush();
    }

    inline void write(output_handler os, std::string_view s)
    {
        os(s.data(), s.size());
    }
}

#endif
