#ifndef FETCHMAP_EITHER_HPP
#define FETCHMAP_EITHER_HPP

#include <stdexcept>
#include <boost/variant.hpp>

namespace fetchmap {

/* Simple sum of two types, modelled on Haskell's Either. By
 * convention the left is the successful value and the right is
 * the error.
 *
 * Useful for modelling errors without exceptions, which gets
 * complicated once futures are passed between threads. A tile
 * which failed to fetch is a normal outcome, not an exceptional
 * one.
 */
template <typename L, typename R>
struct either {
   inline either(const either<L, R> &other) : m_impl(other.m_impl) {}
   inline either(either<L, R> &&other) : m_impl(std::move(other.m_impl)) {}
   inline explicit either(const L &left) : m_impl(left) {}
   inline explicit either(L &&left) : m_impl(std::move(left)) {}
   inline explicit either(const R &right) : m_impl(right) {}
   inline explicit either(R &&right) : m_impl(std::move(right)) {}

   inline either<L, R> &operator=(const either<L, R> &other) { m_impl = other.m_impl; return *this; }
   inline either<L, R> &operator=(either<L, R> &&other) { m_impl = std::move(other.m_impl); return *this; }

   inline bool is_left() const { return boost::get<L>(&m_impl) != nullptr; }
   inline bool is_right() const { return !is_left(); }

   // accessing the wrong side is a programming error.
   inline const L &left() const {
     const L *ptr = boost::get<L>(&m_impl);
     if (ptr == nullptr) { throw std::logic_error("either::left() called on a right value"); }
     return *ptr;
   }

   inline const R &right() const {
     const R *ptr = boost::get<R>(&m_impl);
     if (ptr == nullptr) { throw std::logic_error("either::right() called on a left value"); }
     return *ptr;
   }

private:
   boost::variant<L, R> m_impl;
};

} // namespace fetchmap

#endif /* FETCHMAP_EITHER_HPP */
