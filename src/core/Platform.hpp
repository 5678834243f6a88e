#ifndef PLATFORM_HPP_
#define PLATFORM_HPP_

// MSVC before 2015 lacks constexpr
#if defined(_MSC_VER) && _MSC_VER < 1900
#define NORETURN __declspec(noreturn)
#define CONSTEXPR const
#else
#define NORETURN [[noreturn]]
#define CONSTEXPR constexpr
#endif

#endif /* PLATFORM_HPP_ */
