/*
================================================================================

                             PUBLIC DOMAIN NOTICE
                 National Center for Biotechnology Information

  This software is a "United States Government Work" under the terms of the
  United States Copyright Act.  It was written as part of the author's official
  duties as a United States Government employees and thus cannot be copyrighted.
  This software is freely available to the public for use. The National Library
  of Medicine and the U.S. Government have not placed any restriction on its use
  or reproduction.

  Although all reasonable efforts have been taken to ensure the accuracy and
  reliability of this software, the NLM and the U.S. Government do not and
  cannot warrant the performance or results that may be obtained by using this
  software. The NLM and the U.S. Government disclaim all warranties, expressed
  or implied, including warranties of performance, merchantability or fitness
  for any particular purpose.

  Please cite NCBI in any work or product based on this material.

================================================================================

  Author: Alex Astashyn

*/
#ifndef ITERMORE_FN_HPP_
#define ITERMORE_FN_HPP_

#include <stdexcept>
#include <algorithm>
#include <functional>
#include <memory>
#include <new>
#include <vector>
#include <map>
#include <string>
#include <sstream>
#include <tuple>
#include <utility>
#include <iterator>
#include <type_traits>
#include <cstddef>
#include <cassert>

// Window capacity used by fn::isort() when none is given.
#ifndef ITERMORE_FN_DEFAULT_ISORT_BUFSIZE
#    define ITERMORE_FN_DEFAULT_ISORT_BUFSIZE 1024
#endif

#if defined(_MSC_VER)
#   pragma warning(push)
#   pragma warning(disable: 4068) // unknown pragmas
#endif

#define ITERMORE_FN_THROW(Exception, msg) throw Exception( std::string{} + __FILE__ + ":" + std::to_string(__LINE__) + ": " + (msg) );

namespace itermore
{

/// @brief Lazy single-pass stream operators: scanning, sectioning, bounded sorting and run-grouping.
namespace fn
{
    /// @defgroup errors Errors
    /// All errors are contract violations or malformed inputs;
    /// nothing in the library catches or retries them.
    /// @{

    /// Input does not have the expected shape, e.g. sectionize over a stream that does not start with a section marker.
    struct structure_error : std::logic_error
    {
        using std::logic_error::logic_error;
    };

    /// Invalid static configuration, e.g. a non-positive isort buffer; thrown by the factory functions.
    struct config_error : std::invalid_argument
    {
        using std::invalid_argument::invalid_argument;
    };

    /// The sequential-consumption contract of a sectionized stream was violated.
    struct state_error : std::logic_error
    {
        using std::logic_error::logic_error;
    };

    /// @}

namespace impl
{
    /////////////////////////////////////////////////////////////////////////
    /// Value-or-nothing holder. Unlike std::optional, assignment rebinds
    /// (destroy + placement-new) rather than assigning through, so it works
    /// with types that are move-constructible but not move-assignable,
    /// e.g. closures, or tuples of references.
    template<class T>
    class maybe
    {
        struct nothing {};

        union
        {
            nothing m_nothing;
                  T m_value;
        };

        bool m_engaged = false;

    public:
        using value_type = T;

        static_assert(!std::is_same<T, void>::value, "maybe<void> - missing return-statement in a generator or transform-function?");

        maybe() : m_nothing{}
        {}

        maybe(T val) : m_nothing{}
        {
            emplace(std::move(val));
        }

        maybe(const maybe&) = delete;
        maybe& operator=(const maybe&) = delete;

        maybe(maybe&& other) noexcept : m_nothing{}
        {
            if(other.m_engaged) {
                emplace(std::move(*other));
                other.reset();
            }
        }

        maybe& operator=(maybe&& other) noexcept
        {
            if(this != &other) {
                reset();
                if(other.m_engaged) {
                    emplace(std::move(*other));
                    other.reset();
                }
            }
            return *this;
        }

        ~maybe()
        {
            reset();
        }

        void emplace(T val)
        {
            reset();
            new (&m_value) T(std::move(val));
            m_engaged = true;
        }

        void reset()
        {
            if(m_engaged) {
                get().~T();
                m_engaged = false;
            }
        }

        explicit operator bool() const noexcept
        {
            return m_engaged;
        }

        T& operator*() noexcept
        {
            assert(m_engaged);
            return get();
        }

        const T& operator*() const noexcept
        {
            assert(m_engaged);
            return get();
        }

        T* operator->() noexcept
        {
            return &**this;
        }

        const T* operator->() const noexcept
        {
            return &**this;
        }

    private:
        T& get() noexcept
        {
#if __cplusplus >= 201703L
            return *std::launder(&m_value);
#else
            return m_value;
#endif
        }

        const T& get() const noexcept
        {
#if __cplusplus >= 201703L
            return *std::launder(&m_value);
#else
            return m_value;
#endif
        }
    };

    /////////////////////////////////////////////////////////////////////////
    // SFINAE overload priorities: call f(args..., resolve_overload{}) and the
    // highest-ranked viable overload wins.
    struct pr_lowest {};
    struct pr_low     : pr_lowest {};
    struct pr_high    : pr_low    {};
    struct pr_highest : pr_high   {};

    using resolve_overload = pr_highest;

    /////////////////////////////////////////////////////////////////////////
    // Render a value for an error message; falls back to a placeholder
    // for types without operator<<.
    template<typename T>
    auto describe(const T& x, pr_high) -> decltype(std::declval<std::ostream&>() << x, std::string())
    {
        std::ostringstream ostr;
        ostr << x;
        return ostr.str();
    }

    template<typename T>
    std::string describe(const T&, pr_low)
    {
        return "<value of a non-printable type>";
    }

    template<typename T>
    std::string describe(const T& x)
    {
        return describe(x, resolve_overload{});
    }

}   // namespace impl

    /// @defgroup io Inputs and Outputs
    /*!
    @code
      fn::seq([]{ ... }) % ... // as input-range from a nullary invokable
          std::move(vec) % ... // pass by-move
                    vec  % ... // pass by-copy
    @endcode
    */
    /// @{

    /////////////////////////////////////////////////////////////////////////
    /// @brief Return fn::end_seq() from a generator function to signal end-of-inputs.
    ///
    /// Constructing it throws `fn::end_seq::exception`, which is converted to
    /// end-of-inputs at the library boundary and never escapes it.
    /// The conversion operator lets it stand in either branch of `?:`.
    struct end_seq
    {
        struct exception
        {};

        end_seq()
        {
            throw exception{};
        }

        template<typename T>
        operator T() const
        {
            throw exception{};
        }
    };

namespace impl
{
    /////////////////////////////////////////////////////////////////////////
    // Adapts an exception-signalling user generator to the maybe-protocol.
    // After the first end_seq the user generator is not invoked again.
    template<typename Gen>
    struct catch_end
    {
        Gen gen;
        bool ended;

        using value_type = decltype(gen());

        auto operator()() -> maybe<value_type>
        {
            if(ended) {
                return { };
            }

            try {
                return { gen() };
            } catch( const end_seq::exception& ) {
                ended = true;
                return { };
            }
        }
    };

    /////////////////////////////////////////////////////////////////////////
    template<typename Gen>
    struct get_value_type
    {
        using type = typename Gen::value_type;
    };

    template<typename T>
    struct get_value_type<std::function<impl::maybe<T>()>>
    {
        using type = T;
    };

    /////////////////////////////////////////////////////////////////////////
    /// Single-pass input-range over a nullary generator returning maybe<value_type>.
    ///
    /// The iterator yields rvalue-references: the element belongs to the
    /// range until the iterator is incremented, and downstream stages taking
    /// elements by value receive them without a copy.
    template<typename Gen>
    class seq
    {
    public:
        using value_type = typename get_value_type<Gen>::type;

        static_assert(!std::is_reference<value_type>::value, "The generator must yield a value-type. Use std::ref if necessary.");

        seq(Gen gen)
            : m_gen( std::move(gen) ) // NB: parentheses; Gen may be an aggregate
        {}

        // Conversion to any_seq_t (Gen is a std::function, OtherGen is the concrete generator).
        template<typename OtherGen>
        seq(seq<OtherGen> other)
            : m_current( std::move(other.m_current) )
            , m_gen( std::move(other.m_gen) )
            , m_started( other.m_started )
            , m_ended( other.m_ended )
            , m_resumable( other.m_resumable )
        {
            other.m_started = true;
            other.m_ended   = true;
        }

                   seq(const seq&) = delete;
        seq& operator=(const seq&) = delete;

                        seq(seq&&) = default;
             seq& operator=(seq&&) = default;

        /////////////////////////////////////////////////////////////////////
        class iterator
        {
        public:
            using iterator_category = std::input_iterator_tag;
            using   difference_type = std::ptrdiff_t;
            using        value_type = seq::value_type;
            using           pointer = value_type*;
            using         reference = value_type&&;

            explicit iterator(seq* parent = nullptr) : m_parent{ parent }
            {}

            iterator& operator++()
            {
                if(m_parent && !m_parent->advance()) {
                    m_parent = nullptr;
                }
                return *this;
            }

            reference operator*() const
            {
                return static_cast<reference>(*m_parent->m_current);
            }

            pointer operator->() const
            {
                return &*m_parent->m_current;
            }

            bool operator==(const iterator& other) const
            {
                return m_parent == other.m_parent;
            }

            bool operator!=(const iterator& other) const
            {
                return m_parent != other.m_parent;
            }

        private:
            seq* m_parent;
        };

        /// Advances to the first element. Callable once, unless set_resumable().
        iterator begin()
        {
            if(m_started && !m_resumable) {
                ITERMORE_FN_THROW(std::logic_error, "seq::begin() can only be called once per instance. Call set_resumable() to continue from the current position.");
            }

            if(!m_started) {
                m_started = true;
                return iterator{ advance() ? this : nullptr };
            }

            return iterator{ m_ended ? nullptr : this };
        }

        static iterator end()
        {
            return iterator{};
        }

        seq& set_resumable(bool resumable = true)
        {
            m_resumable = resumable;
            return *this;
        }

        Gen& get_gen()
        {
            return m_gen;
        }

        const Gen& get_gen() const
        {
            return m_gen;
        }

        operator std::vector<value_type>() && // consumes the seq
        {
            std::vector<value_type> ret{};

            if(m_current) {
                ret.push_back(std::move(*m_current));
                m_current.reset();
            }

            if(!m_ended) {
                for(auto x = m_gen(); x; x = m_gen()) {
                    ret.push_back(std::move(*x));
                }
            }

            m_started = true;
            m_ended   = true;

            return ret;
        }

    private:
        template<typename OtherGen>
        friend class seq;

        // Fetches the next element into m_current; false at end-of-inputs.
        // If the generator throws, m_current keeps the previous element.
        bool advance()
        {
            if(m_ended) {
                return false;
            }

            m_current = m_gen();
            m_ended = !m_current;
            return !m_ended;
        }

        maybe<value_type> m_current = {};  // element the iterator points at
                      Gen m_gen;
                     bool m_started   = false;
                     bool m_ended     = false;
                     bool m_resumable = false;
    };

}   // namespace impl

    /////////////////////////////////////////////////////////////////////////
    /// @brief Adapt a generator function as an input-range.
    /*!
    @code
        int i = 0;
        auto evens = fn::seq([&i]
        {
            return i < 10 ? i++ : fn::end_seq();
        })
      % fn::where([](int x)
        {
            return x % 2 == 0;
        })
      % fn::to_vector(); // {0, 2, 4, 6, 8}
    @endcode
    */
    template<typename NullaryInvokable>
    impl::seq<impl::catch_end<NullaryInvokable>> seq(NullaryInvokable gen_fn)
    {
        static_assert(!std::is_reference<decltype(gen_fn())>::value, "The type returned by gen_fn must be a value-type.");
        static_assert(!std::is_same<decltype(gen_fn()), void>::value, "gen_fn is missing a return-statement.");
        return { { std::move(gen_fn), false } };
    }

    /////////////////////////////////////////////////////////////////////////
    /// @brief Type-erased `seq`; implicitly constructible from any `seq`
    /// whose generator is copyable.
    template<typename T>
    using any_seq_t = impl::seq<std::function<impl::maybe<T>()>>;

    /// @}

namespace impl
{
    /////////////////////////////////////////////////////////////////////
    // Key comparisons, unwrapping std::reference_wrapper returned by key-functions.
    struct lt
    {
        template<typename T>
        bool operator()(const T& a, const T& b) const
        {
            return std::less<T>{}(a, b);
        }

        template<typename T>
        bool operator()(const std::reference_wrapper<T>& a,
                        const std::reference_wrapper<T>& b) const
        {
            return std::less<T>{}(a.get(), b.get());
        }
    };

    struct eq
    {
        template<typename T>
        bool operator()(const T& a, const T& b) const
        {
            return a == b;
        }

        template<typename T>
        bool operator()(const std::reference_wrapper<T>& a,
                        const std::reference_wrapper<T>& b) const
        {
            return a.get() == b.get();
        }
    };

    /////////////////////////////////////////////////////////////////////
    template<typename Pred>
    struct negated
    {
        Pred pred;

        template<typename T>
        bool operator()(const T& x)
        {
            return !pred(x);
        }
    };

}   // namespace impl

/// @brief Common key-functions for isort_by and freq_by.
namespace by
{
    struct identity
    {
        template<typename T>
        auto operator()(const T& x) const -> const T&
        {
            return x;
        }
    };

    struct first
    {
        template<typename T>
        auto operator()(const T& x) const -> decltype(*&x.first)
        {
            return x.first;
        }
    };
}   // namespace by

namespace impl
{
    /////////////////////////////////////////////////////////////////////
    // Wraps an Iterable, taken by value, as a generator yielding elements by move.
    struct to_seq
    {
        template<typename Iterable>
        struct gen
        {
            using value_type = typename Iterable::value_type;
            using iterator   = typename Iterable::iterator;

            Iterable src;
            iterator it;
                bool started; // begin() is deferred to the first call, so that
                              // the gen may be moved around before that.

            auto operator()() -> maybe<value_type>
            {
                if(!started) {
                    started = true;
                    it = src.begin();
                }

                if(it == src.end()) {
                    return { };
                }

                return { std::move(*it++) };
            }
        };

        template<typename Gen>
        seq<Gen> operator()(seq<Gen> s) const
        {
            return s;
        }

        template<typename Iterable>
        seq<gen<Iterable>> operator()(Iterable src) const
        {
            return { { std::move(src), {}, false } };
        }
    };

    /////////////////////////////////////////////////////////////////////
    // The generator type an Iterable is consumed through: a seq gives up
    // its own generator, anything else is wrapped with to_seq::gen.
    template<typename Iterable>
    struct gen_of
    {
        using type = to_seq::gen<Iterable>;

        static type make(Iterable src)
        {
            return { std::move(src), {}, false };
        }
    };

    template<typename Gen>
    struct gen_of<seq<Gen>>
    {
        using type = Gen;

        static type make(seq<Gen> src)
        {
            return std::move(src.get_gen());
        }
    };

    /////////////////////////////////////////////////////////////////////
    struct to_vector
    {
        template<typename T>
        std::vector<T> operator()(std::vector<T> vec) const
        {
            return vec;
        }

        template<typename Gen,
                 typename Vec = std::vector<typename seq<Gen>::value_type>>
        Vec operator()(seq<Gen> s) const
        {
            return static_cast<Vec>(std::move(s));
        }

        template<typename Iterable,
                 typename Vec = std::vector<typename Iterable::value_type>>
        Vec operator()(Iterable src) const
        {
            return Vec{ std::make_move_iterator(src.begin()),
                        std::make_move_iterator(src.end()) };
        }
    };

    /////////////////////////////////////////////////////////////////////////
    // Stages compose over a seq by taking its generator, wrapping it in
    // their own gen, and returning the result as a seq again.
    // A container argument is first wrapped with to_seq.
    //
    // The arguments are the initializers of gen's fields after the upstream generator.
#define ITERMORE_FN_OVERLOAD_FOR_SEQ(...)                                  \
    template<typename InGen>                                               \
    auto operator()(seq<InGen> in) const -> seq<gen<InGen>>                \
    {                                                                      \
        return { { std::move(in.get_gen()), __VA_ARGS__ } };               \
    }

#define ITERMORE_FN_OVERLOAD_FOR_CONT                                      \
    template<typename Cont>                                                \
    auto operator()(Cont cont) const -> seq<gen<to_seq::gen<Cont>>>        \
    {                                                                      \
        return this->operator()(to_seq{}(std::move(cont)));                \
    }

    /////////////////////////////////////////////////////////////////////
    template<typename F>
    struct transform
    {
        F map_fn;

        template<typename InGen>
        struct gen
        {
            InGen in_gen;
                F map_fn;

            using value_type = decltype(std::declval<F&>()(std::declval<typename get_value_type<InGen>::type>()));

            static_assert(!std::is_same<value_type, void>::value, "The transform-function is missing a return-statement.");

            auto operator()() -> maybe<value_type>
            {
                auto x = in_gen();
                if(!x) {
                    return { };
                }
                return { map_fn(std::move(*x)) };
            }
        };

        ITERMORE_FN_OVERLOAD_FOR_SEQ( map_fn )
        ITERMORE_FN_OVERLOAD_FOR_CONT
    };

    /////////////////////////////////////////////////////////////////////
    template<typename Pred>
    struct where
    {
        Pred pred;

        template<typename InGen>
        struct gen
        {
            InGen in_gen;
             Pred pred;

            using value_type = typename get_value_type<InGen>::type;

            auto operator()() -> maybe<value_type>
            {
                for(auto x = in_gen(); x; x = in_gen()) {
                    if(pred(*x)) {
                        return x;
                    }
                }
                return { };
            }
        };

        ITERMORE_FN_OVERLOAD_FOR_SEQ( pred )
        ITERMORE_FN_OVERLOAD_FOR_CONT
    };

    /////////////////////////////////////////////////////////////////////
    // Does not pull from upstream once the count is reached, so the
    // upstream position is exactly after the last yielded element.
    struct take_first
    {
        const size_t cap;

        template<typename InGen>
        struct gen
        {
             InGen in_gen;
            size_t remaining;

            using value_type = typename get_value_type<InGen>::type;

            auto operator()() -> maybe<value_type>
            {
                if(remaining == 0) {
                    return { };
                }
                --remaining;
                return in_gen();
            }
        };

        ITERMORE_FN_OVERLOAD_FOR_SEQ( cap )
        ITERMORE_FN_OVERLOAD_FOR_CONT
    };

    /////////////////////////////////////////////////////////////////////
    template<typename F>
    struct for_each
    {
        F fn; // may be stateful

        template<typename Iterable>
        void operator()(Iterable&& src)
        {
            for(auto it = src.begin(); it != src.end(); ++it) {
                fn(*it);
            }
        }
    };

    /////////////////////////////////////////////////////////////////////
    /// One-element lookahead over a generator.
    ///
    /// Holds zero or one peeked element. After a peek the next pull returns
    /// exactly that element. Once the generator reported end-of-inputs it is
    /// not invoked again, so exhaustion is sticky.
    template<typename Gen>
    class cursor
    {
    public:
        using value_type = typename get_value_type<Gen>::type;

        explicit cursor(Gen gen)
            : m_gen( std::move(gen) )
        {}

        /// Next element without consuming it; nullptr at end-of-inputs.
        /// The pointer is valid until the next pull.
        const value_type* peek()
        {
            if(!m_peeked && !m_ended) {
                m_peeked = m_gen();
                m_ended = !m_peeked;
            }
            return m_peeked ? &*m_peeked : nullptr;
        }

        maybe<value_type> pull()
        {
            if(!peek()) {
                return { };
            }
            ++m_num_pulled;
            return std::move(m_peeked);
        }

        maybe<value_type> operator()()
        {
            return pull();
        }

        explicit operator bool()
        {
            return peek() != nullptr;
        }

        /// Number of elements handed out by pull() so far.
        size_t pulled() const noexcept
        {
            return m_num_pulled;
        }

    private:
                      Gen m_gen;
        maybe<value_type> m_peeked     = {};
                   size_t m_num_pulled = 0;
                     bool m_ended      = false;
    };

    /////////////////////////////////////////////////////////////////////
    /// Predicate-driven scanning over a cursor.
    ///
    /// The scanner owns its cursor on the heap, so sequences returned by
    /// scan_while/scan_until/rest stay valid if the scanner is moved;
    /// they must not outlive it.
    ///
    /// All sequences advance the same cursor. Only one of them may be
    /// iterated at a time; interleaving two of them interleaves the
    /// elements they receive.
    template<typename Gen>
    class scanner
    {
    public:
        using cursor_t   = cursor<Gen>;
        using value_type = typename cursor_t::value_type;

        template<typename Pred>
        struct scan_gen
        {
            using value_type = scanner::value_type;

            cursor_t* src;
                 Pred pred;
                 bool stopped; // after the first unsatisfying element (or end)

            auto operator()() -> maybe<value_type>
            {
                if(stopped) {
                    return { };
                }

                const value_type* next = src->peek();

                if(!next || !pred(*next)) {
                    stopped = true;
                    return { };
                }

                return src->pull();
            }
        };

        struct rest_gen
        {
            using value_type = scanner::value_type;

            cursor_t* src;

            auto operator()() -> maybe<value_type>
            {
                return src->pull();
            }
        };

        explicit scanner(Gen gen)
            : m_cursor{ new cursor_t{ std::move(gen) } }
        {}

        /// Yield elements while pred holds for the next element; the first
        /// element failing pred is left in place.
        template<typename Pred>
        seq<scan_gen<Pred>> scan_while(Pred pred)
        {
            return { { m_cursor.get(), std::move(pred), false } };
        }

        template<typename Pred>
        seq<scan_gen<negated<Pred>>> scan_until(Pred pred)
        {
            return scan_while(negated<Pred>{ std::move(pred) });
        }

        /// Consume what scan_while(pred) would yield; return the number of discarded elements.
        template<typename Pred>
        size_t skip_while(Pred pred)
        {
            auto gen = scan_gen<Pred>{ m_cursor.get(), std::move(pred), false };

            size_t num_skipped = 0;
            while(gen()) {
                ++num_skipped;
            }
            return num_skipped;
        }

        template<typename Pred>
        size_t skip_until(Pred pred)
        {
            return skip_while(negated<Pred>{ std::move(pred) });
        }

        /// Next raw element, bypassing predicates; empty at end-of-inputs.
        maybe<value_type> next()
        {
            return m_cursor->pull();
        }

        const value_type* peek()
        {
            return m_cursor->peek();
        }

        explicit operator bool()
        {
            return peek() != nullptr;
        }

        /// Yields the remaining elements.
        seq<rest_gen> rest()
        {
            return { { m_cursor.get() } };
        }

        /// Number of elements consumed so far, by any of the operations.
        size_t position() const noexcept
        {
            return m_cursor->pulled();
        }

    private:
        std::unique_ptr<cursor_t> m_cursor;
    };

    /////////////////////////////////////////////////////////////////////
    // Splits a stream into (marker, subseq) pairs.
    //
    // The outer gen owns the cursor; subseqs refer back to it, so they must
    // not outlive the outer seq, and the outer seq must not be moved while
    // a subseq is alive.
    //
    // Requesting the next section while the current subseq still has
    // non-marker elements ahead throws state_error. The element that
    // revealed this stays buffered in the cursor, so the subseq can still be
    // drained and the request retried. A subseq whose remainder is empty
    // does not block, even if it was never iterated.
    template<typename Pred>
    struct sectionize
    {
        Pred is_section;

        template<typename InGen>
        struct gen
        {
            using element_type = typename get_value_type<InGen>::type;

            struct subgen
            {
                using value_type = element_type;

                   gen* parent;
                 size_t section_num; // which section this subseq belongs to

                auto operator()() -> maybe<value_type>
                {
                    assert(parent);
                    return parent->next_in_section(section_num);
                }
            };

            using value_type = std::pair<element_type, seq<subgen>>;

            cursor<InGen> input;
                     Pred is_section;
                   size_t section_num;  // number of sections handed out so far
                     bool section_done; // current subseq has reached its end

            maybe<element_type> next_in_section(size_t num)
            {
                // a subseq of an earlier section yields nothing
                if(num != section_num || section_done) {
                    return { };
                }

                const element_type* next = input.peek();

                if(!next || is_section(*next)) {
                    section_done = true;
                    return { };
                }

                return input.pull();
            }

            auto operator()() -> maybe<value_type>
            {
                if(!section_done) {
                    const element_type* next = input.peek();

                    if(next && !is_section(*next)) {
                        ITERMORE_FN_THROW(state_error,
                            "section #" + std::to_string(section_num)
                          + " must be consumed before requesting the next one; pending element: "
                          + describe(*next));
                    }
                    section_done = true;
                }

                auto marker = input.pull();

                if(!marker) {
                    return { };
                }

                if(!is_section(*marker)) {
                    ITERMORE_FN_THROW(structure_error, "expected a section, but found: " + describe(*marker));
                }

                ++section_num;
                section_done = false;

                return { value_type{ std::move(*marker), seq<subgen>{ subgen{ this, section_num } } } };
            }
        };

        template<typename InGen>
        seq<gen<InGen>> operator()(seq<InGen> in) const
        {
            return { { cursor<InGen>{ std::move(in.get_gen()) }, is_section, 0, true } };
        }

        template<typename Cont>
        seq<gen<to_seq::gen<Cont>>> operator()(Cont cont) const
        {
            return this->operator()(to_seq{}(std::move(cont)));
        }
    };

    /////////////////////////////////////////////////////////////////////
    // Sliding-window partial sort with a fixed-capacity min-heap.
    //
    // Seed the window with the first `cap` elements; then for every further
    // element push it and pop the minimum (or emit it directly if nothing in
    // the window precedes it); after end-of-inputs drain the window.
    //
    // Window entries carry their arrival ordinal: equal keys come out
    // first-seen-first, and elements are never compared themselves,
    // only their keys.
    template<typename F>
    struct isort_by
    {
        const F      key_fn;
        const size_t cap;

        template<typename InGen>
        struct gen
        {
            using value_type = typename get_value_type<InGen>::type;

            static_assert(std::is_move_assignable<value_type>::value, "value_type must be move-assignable.");

            struct entry
            {
                value_type value;
                    size_t ordinal;
            };

                         InGen in_gen;
                       const F key_fn;
                  const size_t cap;
            std::vector<entry> window;
                        size_t num_seen;
                          bool seeded;
                          bool input_ended;

            // key_fn is evaluated per comparison; it is expected to be light.
            bool precedes(const entry& a, const entry& b) const
            {
                const auto& key_a = key_fn(a.value); // NB: temporary lifetime extension
                const auto& key_b = key_fn(b.value);

                return lt{}(key_a, key_b) ? true
                     : lt{}(key_b, key_a) ? false
                     :                      a.ordinal < b.ordinal;
            }

            auto operator()() -> maybe<value_type>
            {
                // std heap-functions keep the greatest element at front,
                // so "greater" here means "emitted earlier".
                auto op_later = [this](const entry& a, const entry& b)
                {
                    return precedes(b, a);
                };

                if(!seeded) {
                    seeded = true;
                    while(window.size() < cap) {
                        auto x = in_gen();
                        if(!x) {
                            input_ended = true;
                            break;
                        }
                        window.push_back(entry{ std::move(*x), num_seen++ });
                    }

                    std::make_heap(window.begin(), window.end(), op_later);
                }

                if(!input_ended) {
                    auto x = in_gen();

                    if(x) {
                        auto incoming = entry{ std::move(*x), num_seen++ };

                        if(!precedes(window.front(), incoming)) {
                            return { std::move(incoming.value) };
                        }

                        std::pop_heap(window.begin(), window.end(), op_later);
                        auto ret = std::move(window.back().value);
                        window.back() = std::move(incoming);
                        std::push_heap(window.begin(), window.end(), op_later);

                        return { std::move(ret) };
                    }

                    input_ended = true;
                }

                if(window.empty()) {
                    return { };
                }

                std::pop_heap(window.begin(), window.end(), op_later);
                auto ret = std::move(window.back().value);
                window.pop_back();

                return { std::move(ret) };
            }
        };

        ITERMORE_FN_OVERLOAD_FOR_SEQ( key_fn, cap, {}, 0, false, false )
        ITERMORE_FN_OVERLOAD_FOR_CONT
    };

    /////////////////////////////////////////////////////////////////////
    template<size_t... Is>
    struct indices
    {};

    template<size_t N, size_t... Is>
    struct make_indices : make_indices<N - 1, N - 1, Is...>
    {};

    template<size_t... Is>
    struct make_indices<0, Is...>
    {
        using type = indices<Is...>;
    };

    // (k, r1, r2, ...) -> (k, tuple(r1, r2, ...))
    template<typename T,
             typename Idx = typename make_indices<std::tuple_size<T>::value - 1>::type>
    struct split_leading;

    template<typename T, size_t... Is>
    struct split_leading<T, indices<Is...>>
    {
        using key_type  = typename std::tuple_element<0, T>::type;
        using rest_type = std::tuple<typename std::tuple_element<Is + 1, T>::type...>;

        static std::pair<key_type, rest_type> split(T x)
        {
            return { std::move(std::get<0>(x)), rest_type{ std::move(std::get<Is + 1>(x))... } };
        }
    };

    // (k, v) -> (k, v)
    template<typename T>
    struct split_bare
    {
        static_assert(std::tuple_size<T>::value == 2, "grouper(fn::bare()) expects pairs or 2-tuples.");

        using key_type  = typename std::tuple_element<0, T>::type;
        using rest_type = typename std::tuple_element<1, T>::type;

        static std::pair<key_type, rest_type> split(T x)
        {
            return { std::move(std::get<0>(x)), std::move(std::get<1>(x)) };
        }
    };

    struct leading_mode
    {
        template<typename T>
        using split = split_leading<T>;
    };

    struct bare_mode
    {
        template<typename T>
        using split = split_bare<T>;
    };

    struct bare_tag {};

    /////////////////////////////////////////////////////////////////////
    // Groups adjacent tuples having equal leading element.
    //
    // Either nothing is pending, or `pending` holds the head of the next run
    // (pulled while closing the previous one); no sentinel key is needed.
    template<typename Mode>
    struct grouper
    {
        template<typename InGen>
        struct gen
        {
            using split_t    = typename Mode::template split<typename get_value_type<InGen>::type>;
            using key_type   = typename split_t::key_type;
            using rest_type  = typename split_t::rest_type;
            using item_type  = std::pair<key_type, rest_type>;
            using value_type = std::pair<key_type, std::vector<rest_type>>;

                       InGen in_gen;
            maybe<item_type> pending;

            auto operator()() -> maybe<value_type>
            {
                if(!pending) {
                    auto x = in_gen();
                    if(!x) {
                        return { };
                    }
                    pending = split_t::split(std::move(*x));
                }

                auto head = std::move(*pending);
                pending.reset();

                value_type run( std::move(head.first), std::vector<rest_type>{} );
                run.second.push_back(std::move(head.second));

                for(auto x = in_gen(); x; x = in_gen()) {
                    auto item = split_t::split(std::move(*x));

                    if(!eq{}(run.first, item.first)) {
                        pending = std::move(item);
                        break;
                    }
                    run.second.push_back(std::move(item.second));
                }

                return { std::move(run) };
            }
        };

        ITERMORE_FN_OVERLOAD_FOR_SEQ( {} )
        ITERMORE_FN_OVERLOAD_FOR_CONT
    };

    /////////////////////////////////////////////////////////////////////
    // Emptiness test: x.empty() if available, otherwise !bool(x).
    template<typename T>
    auto is_nonempty(const T& x, pr_high) -> decltype(x.empty(), bool())
    {
        return !x.empty();
    }

    template<typename T>
    auto is_nonempty(const T& x, pr_low) -> decltype(static_cast<bool>(x))
    {
        return static_cast<bool>(x);
    }

    struct nonempty
    {
        template<typename T>
        bool operator()(const T& x) const
        {
            return is_nonempty(x, resolve_overload{});
        }
    };

    struct compact
    {
        template<typename Iterable>
        auto operator()(Iterable src) const -> std::vector<typename get_value_type<typename gen_of<Iterable>::type>::type>
        {
            return to_vector{}(where<nonempty>{ nonempty{} }(std::move(src)));
        }
    };

    /////////////////////////////////////////////////////////////////////
    template<typename F>
    struct freq_by
    {
        const F      key_fn;
        const size_t min_freq;

        template<typename Iterable>
        auto operator()(Iterable&& src) const
            -> std::map<typename std::decay<decltype(key_fn(*src.begin()))>::type, size_t>
        {
            using key_t = typename std::decay<decltype(key_fn(*src.begin()))>::type;

            auto ret = std::map<key_t, size_t>{};

            for(auto&& x : src) {
                ++ret[key_fn(x)];
            }

            for(auto it = ret.begin(); it != ret.end(); ) {
                it = it->second < min_freq ? ret.erase(it) : std::next(it);
            }

            return ret;
        }
    };

    /////////////////////////////////////////////////////////////////////
    template<typename F>
    struct side_effect
    {
        F fn;

        template<typename InGen>
        struct gen
        {
            InGen in_gen;
                F fn;

            using value_type = typename get_value_type<InGen>::type;

            auto operator()() -> maybe<value_type>
            {
                auto x = in_gen();
                if(x) {
                    fn(static_cast<const value_type&>(*x));
                }
                return x;
            }
        };

        ITERMORE_FN_OVERLOAD_FOR_SEQ( fn )
        ITERMORE_FN_OVERLOAD_FOR_CONT
    };

    // Buffers up to chunk_size elements, invokes fn with the chunk, then
    // yields the buffered elements. The last chunk may be short.
    template<typename F>
    struct side_effect_chunked
    {
              F fn;
        const size_t chunk_size;

        template<typename InGen>
        struct gen
        {
            using value_type = typename get_value_type<InGen>::type;

                               InGen in_gen;
                                   F fn;
                        const size_t chunk_size;
            std::vector<value_type> chunk;
                              size_t pos; // next element of chunk to yield

            auto operator()() -> maybe<value_type>
            {
                if(pos == chunk.size()) {
                    chunk.clear();
                    pos = 0;

                    while(chunk.size() < chunk_size) {
                        auto x = in_gen();
                        if(!x) {
                            break;
                        }
                        chunk.push_back(std::move(*x));
                    }

                    if(chunk.empty()) {
                        return { };
                    }

                    fn(static_cast<const std::vector<value_type>&>(chunk));
                }

                return { std::move(chunk[pos++]) };
            }
        };

        ITERMORE_FN_OVERLOAD_FOR_SEQ( fn, chunk_size, {}, 0 )
        ITERMORE_FN_OVERLOAD_FOR_CONT
    };

}   // namespace impl

    /////////////////////////////////////////////////////////////////////////

    /// @defgroup to_vec to_vector/to_seq
    /// @{

    /// @brief Move elements of an `Iterable` to std::vector.
    inline impl::to_vector to_vector()
    {
        return {};
    }

    /// @brief Wrap an `Iterable`, taken by value, as `seq` yielding elements by-move.
    inline impl::to_seq to_seq()
    {
        return {};
    }

    /// @}
    /// @defgroup stages Composition
    /// @{

    /// @brief Yield results of applying map_fn to the elements.
    template<typename F>
    impl::transform<F> transform(F map_fn)
    {
        return { std::move(map_fn) };
    }

    /// @brief Filter elements.
    template<typename P>
    impl::where<P> where(P pred)
    {
        return { std::move(pred) };
    }

    /// @brief Yield first `n` elements; does not pull the element after them.
    inline impl::take_first take_first(size_t n = 1)
    {
        return { n };
    }

    /// @brief Invoke fn on each element.
    template<typename F>
    impl::for_each<F> for_each(F fn)
    {
        return { std::move(fn) };
    }

    /// @brief Negate a unary predicate.
    template<typename P>
    impl::negated<P> invert(P pred)
    {
        return { std::move(pred) };
    }

    /// @}
    /// @defgroup scanning Scanning
    /// @{

    /////////////////////////////////////////////////////////////////////////
    /// @brief Wrap an `Iterable` (or a `seq`) with one-element lookahead.
    /*!
    @code
        auto c = fn::cursor(std::vector<int>{{ 1, 2 }});
        c.peek();   // -> 1, not consumed
        c.pull();   // -> 1
        c.pull();   // -> 2
        c.pull();   // -> empty, and stays empty
    @endcode
    */
    template<typename Iterable>
    impl::cursor<typename impl::gen_of<Iterable>::type> cursor(Iterable src)
    {
        return impl::cursor<typename impl::gen_of<Iterable>::type>{
            impl::gen_of<Iterable>::make(std::move(src)) };
    }

    /////////////////////////////////////////////////////////////////////////
    /// @brief Predicate-driven scanner over an `Iterable` (or a `seq`).
    /*!
    @code
        auto sc = fn::scanner(tokens);

        sc.skip_until(is_digit);                    // discard the prefix
        auto digits = sc.scan_while(is_digit)       // lazily
                    % fn::to_vector();
        auto tail = sc.rest() % fn::to_vector();    // whatever is left
    @endcode

    Abandoning a scan early leaves the scanner right after the last element
    that scan yielded.
    */
    template<typename Iterable>
    impl::scanner<typename impl::gen_of<Iterable>::type> scanner(Iterable src)
    {
        return impl::scanner<typename impl::gen_of<Iterable>::type>{
            impl::gen_of<Iterable>::make(std::move(src)) };
    }

    /// @}
    /// @defgroup grouping Sectioning and Grouping
    /// @{

    /////////////////////////////////////////////////////////////////////////
    /// @brief Split a stream into `std::pair<marker, subseq>` at elements satisfying `is_section`.
    /*!
    @code
        auto is_section = [](const std::string& s) { return std::isalpha(s[0]); };

        std::vector<std::string>{ "A", "0", "1", "2", "B", "3", "4" }
      % fn::sectionize(is_section)
      % fn::for_each([](std::pair<std::string, ...> sec)
        {
            // ("A", ["0", "1", "2"]), then ("B", ["3", "4"])
            for(auto& x : sec.second) { ... }
        });
    @endcode

    The first element must be a marker, otherwise `fn::structure_error` is
    thrown when the first section is requested.

    A subseq must be consumed before the next section is requested;
    otherwise `fn::state_error` is thrown and nothing is lost: the subseq
    may still be drained and the request repeated.

    Buffering space requirements: one element.
    */
    template<typename P>
    impl::sectionize<P> sectionize(P is_section)
    {
        return { std::move(is_section) };
    }

    /////////////////////////////////////////////////////////////////////////
    /// @brief Group adjacent tuples by their first element.
    ///
    /// `(k, a, b)` elements yield `std::pair<K, std::vector<std::tuple<A, B>>>`.
    /// Only adjacent runs are grouped, so non-adjacent equal keys
    /// yield separate groups, as in run-length encoding.
    ///
    /// Buffering space requirements: `O(max-run-length)`.
    inline impl::grouper<impl::leading_mode> grouper()
    {
        return {};
    }

    /// @brief Tag for `grouper(fn::bare())`.
    inline impl::bare_tag bare()
    {
        return {};
    }

    /// @brief Group adjacent `(k, v)` pairs, yielding `std::pair<K, std::vector<V>>`.
    inline impl::grouper<impl::bare_mode> grouper(impl::bare_tag)
    {
        return {};
    }

    /// @}
    /// @defgroup ordering Ordering
    /// @{

    /////////////////////////////////////////////////////////////////////////
    /// @brief Best-effort lazy sort with a lookahead window of `bufsize` elements.
    ///
    /// Always yields the smallest element (by key_fn) within the window.
    /// The output is fully sorted when no element is further than `bufsize`
    /// positions from its sorted position; larger windows give better order.
    ///
    /// Elements with equal keys are yielded in order of arrival.
    /// Throws `fn::config_error` if `bufsize <= 0`.
    ///
    /// Buffering space requirements: `O(bufsize)`; time complexity: `O(N*log(bufsize))`.
    /*!
    @code
        std::vector<int>{{ 1, 4, 9, 2, 5, 3, 7, 8, 0, 6 }}
      % fn::isort(3)
      % fn::to_vector(); // 1, 2, 3, 4, 5, 0, 6, 7, 8, 9
    @endcode
    */
    template<typename F>
    impl::isort_by<F> isort_by(std::ptrdiff_t bufsize, F key_fn)
    {
        if(bufsize <= 0) {
            ITERMORE_FN_THROW(config_error, "isort buffer size must be positive, got " + std::to_string(bufsize));
        }
        return { std::move(key_fn), size_t(bufsize) };
    }

    /// @brief `isort_by with key_fn = by::identity`
    inline impl::isort_by<by::identity> isort(std::ptrdiff_t bufsize = ITERMORE_FN_DEFAULT_ISORT_BUFSIZE)
    {
        return isort_by(bufsize, by::identity{});
    }

    /// @}
    /// @defgroup helpers Filtering, Counting, Tapping
    /// @{

    /// @brief Lazily drop empty elements: empty containers and strings, zeros, null pointers, false.
    inline impl::where<impl::nonempty> icompact()
    {
        return { {} };
    }

    /// @brief Eager `icompact`, returning a std::vector.
    inline impl::compact compact()
    {
        return {};
    }

    /// @brief Drop entries of an associative container whose mapped value is empty.
    template<typename Map>
    Map compact_dict(Map m)
    {
        for(auto it = m.begin(); it != m.end(); ) {
            if(impl::is_nonempty(it->second, impl::resolve_overload{})) {
                ++it;
            } else {
                it = m.erase(it);
            }
        }
        return m;
    }

    /// @brief Frequency table `std::map<key, size_t>` of key_fn over the elements,
    /// keeping keys seen at least `min_freq` times.
    template<typename F>
    impl::freq_by<F> freq_by(F key_fn, size_t min_freq = 0)
    {
        return { std::move(key_fn), min_freq };
    }

    /// @brief `freq_by with key_fn = by::identity`
    inline impl::freq_by<by::identity> freq(size_t min_freq = 0)
    {
        return { by::identity{}, min_freq };
    }

    /// @brief Pass elements through unchanged, invoking fn on each (by const-reference) first.
    ///
    /// Useful for lazy counting, logging or progress reporting.
    template<typename F>
    impl::side_effect<F> side_effect(F fn)
    {
        return { std::move(fn) };
    }

    /// @brief Pass elements through unchanged, invoking fn on each chunk
    /// (`const std::vector<value_type>&`) of up to `chunk_size` elements
    /// before yielding its elements.
    ///
    /// Throws `fn::config_error` if `chunk_size == 0`.
    /*!
    @code
        std::move(records)
      % fn::side_effect([](const std::vector<record_t>& chunk)
        {
            std::cerr << "Processed " << chunk.size() << " records\n";
        }, 1000)
      % ...
    @endcode
    */
    template<typename F>
    impl::side_effect_chunked<F> side_effect(F fn, size_t chunk_size)
    {
        if(chunk_size == 0) {
            ITERMORE_FN_THROW(config_error, "side_effect chunk size must be at least 1.");
        }
        return { std::move(fn), chunk_size };
    }

    /// @}

namespace operators
{
    /// @brief `return std::forward<F>(fn)(std::forward<Arg>(arg))`
    ///
    /// Left-to-right function application: `inputs % fn::isort(8) % fn::to_vector()`.
    template<typename Arg, typename F>
    auto operator % (Arg&& arg, F&& fn) -> decltype( std::forward<F>(fn)(std::forward<Arg>(arg)) )
    {
        return std::forward<F>(fn)(std::forward<Arg>(arg));
    }

} // namespace operators

} // namespace fn

} // namespace itermore



#if defined(ITERMORE_FN_ENABLE_RUN_TESTS) && ITERMORE_FN_ENABLE_RUN_TESTS
#include <string>
#include <tuple>
#include <iostream>
#include <numeric>
#include <cctype>
#include <cstdlib>
#include <limits>

#ifndef VERIFY
#define VERIFY(expr) if(!(expr)) ITERMORE_FN_THROW(std::logic_error, "Assertion failed: ( "#expr" ).");
#endif

namespace itermore
{
namespace fn
{
namespace impl
{

// Move-only wrapper over an int; the operators must work with
// element types that can't be copied.
struct X
{
    int value;

    X(int i) : value{ i }
    {}

               X(X&&) = default;
    X& operator=(X&&) = default;

               X(const X&) = delete;
    X& operator=(const X&) = delete;

    operator int&()
    {
        return value;
    }

    operator const int&() const
    {
        return value;
    }
};
using Xs = std::vector<X>;

using vec_t = std::vector<int>;

struct as_ints
{
    template<typename Iterable>
    vec_t operator()(Iterable&& src) const
    {
        vec_t ret;
        for(auto&& x : src) {
            ret.push_back(int(x));
        }
        return ret;
    }
};

struct is_negative
{
    bool operator()(const X& x) const
    {
        return x < 0;
    }
};

struct dist_from_3
{
    int operator()(const X& x) const
    {
        return std::abs(3 - int(x));
    }
};

struct by_tens
{
    std::pair<int, X> operator()(X x) const
    {
        return std::pair<int, X>{ int(x) / 10, std::move(x) };
    }
};

using sections_t = std::vector<std::pair<int, vec_t>>;

template<typename Sections>
sections_t drain_sections(Sections&& sections)
{
    sections_t ret;
    for(auto&& sec : sections) {
        ret.emplace_back(int(sec.first), as_ints{}(sec.second));
    }
    return ret;
}

// Templated on the input-maker, so that the same battery runs
// over containers and over lazy seqs.
template<typename MakeInputs>
std::map<std::string, std::function<void()>> make_tests(MakeInputs make_inputs)
{
    std::map<std::string, std::function<void()>> tests{};
    using fn::operators::operator%;

    /////////////////////////////////////////////////////////////////////////

    tests["cursor"] = [=]
    {
        auto c = fn::cursor(make_inputs({1, 2, 3}));

        VERIFY(c.peek() != nullptr);
        VERIFY(c.peek() == c.peek()); // cached, not re-pulled
        VERIFY(*c.peek() == 1);
        VERIFY(c.pulled() == 0);

        auto x1 = c.pull();
        VERIFY(x1 && *x1 == 1);
        VERIFY(c.pulled() == 1);

        auto x2 = c();
        VERIFY(x2 && *x2 == 2);
        VERIFY(*c.peek() == 3);

        auto x3 = c.pull();
        VERIFY(x3 && *x3 == 3);

        VERIFY(!c.peek());
        VERIFY(!c.pull());
        VERIFY(!c.pull());
        VERIFY(!c);
        VERIFY(c.pulled() == 3);
    };

    tests["scanner: empty input"] = [=]
    {
        auto sc = fn::scanner(make_inputs({}));
        auto is_small = [](const X& x) { return x < 10; };

        VERIFY((sc.scan_until(is_small) % as_ints{}).empty());
        VERIFY((sc.scan_while(is_small) % as_ints{}).empty());
        VERIFY(sc.skip_while(is_small) == 0);
        VERIFY(!sc.next());
        VERIFY(!sc);
    };

    tests["scanner: scan_until, scan_while"] = [=]
    {
        auto sc = fn::scanner(make_inputs({0, 1, 2, 3, 4, 5, 6, 7}));
        auto bigger_than_3 = [](const X& x) { return x > 3; };

        VERIFY((sc.scan_until(bigger_than_3) % as_ints{} == vec_t{0, 1, 2, 3}));
        VERIFY((sc.scan_until(bigger_than_3) % as_ints{}).empty());
        VERIFY((sc.scan_while(bigger_than_3) % as_ints{} == vec_t{4, 5, 6, 7}));
        VERIFY(!sc);
    };

    tests["scanner: rest"] = [=]
    {
        auto sc = fn::scanner(make_inputs({0, 1, 2, 3, 4, 5, 6, 7}));
        auto bigger_than_3 = [](const X& x) { return x > 3; };

        VERIFY((sc.scan_until(bigger_than_3) % as_ints{} == vec_t{0, 1, 2, 3}));
        VERIFY((sc.rest() % as_ints{} == vec_t{4, 5, 6, 7}));
        VERIFY(sc.position() == 8);
    };

    tests["scanner: next() between scans"] = [=]
    {
        auto sc = fn::scanner(make_inputs({0, 1, 2, 3, 4, 5, 6, 7}));
        auto bigger_than_3 = [](const X& x) { return x > 3; };

        VERIFY((sc.scan_until(bigger_than_3) % as_ints{} == vec_t{0, 1, 2, 3}));

        auto x4 = sc.next();
        auto x5 = sc.next();
        VERIFY(x4 && *x4 == 4);
        VERIFY(x5 && *x5 == 5);

        VERIFY((sc.scan_while(bigger_than_3) % as_ints{} == vec_t{6, 7}));
        VERIFY(!sc.next());
        VERIFY(!sc.next());
    };

    tests["scanner: skip_while consumes what scan_while yields"] = [=]
    {
        for(int threshold = 0; threshold <= 6; threshold++) {
            auto less_than = [threshold](const X& x) { return x < threshold; };

            auto sc1 = fn::scanner(make_inputs({0, 1, 2, 3, 4}));
            auto sc2 = fn::scanner(make_inputs({0, 1, 2, 3, 4}));

            const auto scanned = sc1.scan_while(less_than) % as_ints{};
            const auto num_skipped = sc2.skip_while(less_than);

            VERIFY(scanned.size() == num_skipped);
            VERIFY(sc1.position() == sc2.position());
            VERIFY((sc1.rest() % as_ints{} == sc2.rest() % as_ints{}));
        }
    };

    tests["scanner: skip_until"] = [=]
    {
        auto sc = fn::scanner(make_inputs({1, 3, 5, 6, 7, 8}));
        auto is_even = [](const X& x) { return x == 6 || x == 8; };

        VERIFY(sc.skip_until(is_even) == 3);
        VERIFY(*sc.peek() == 6);
        VERIFY(sc.skip_until(is_even) == 0);
        VERIFY(sc.skip_while(is_even) == 1);
        VERIFY((sc.rest() % as_ints{} == vec_t{7, 8}));
    };

    tests["scanner: consumed prefixes and remainder reconstruct the input"] = [=]
    {
        auto sc = fn::scanner(make_inputs({5, 3, 8, 1, 9, 2, 7, 4}));

        vec_t res{};
        auto append = [&res](vec_t v)
        {
            res.insert(res.end(), v.begin(), v.end());
        };

        append(sc.scan_while([](const X& x) { return x > 2; }) % as_ints{}); // 5, 3, 8

        auto x = sc.next();
        VERIFY(x);
        res.push_back(int(*x));                                              // 1

        append(sc.scan_until([](const X& x) { return x == 7; }) % as_ints{}); // 9, 2
        append(sc.rest() % as_ints{});                                        // 7, 4

        VERIFY((res == vec_t{5, 3, 8, 1, 9, 2, 7, 4}));
    };

    tests["scanner: abandoning a scan"] = [=]
    {
        auto sc = fn::scanner(make_inputs({0, 1, 2, 3, 4, 5, 6, 7}));
        auto always = [](const X&) { return true; };

        VERIFY((sc.scan_while(always) % fn::take_first(2) % as_ints{} == vec_t{0, 1}));
        VERIFY(sc.position() == 2);

        {
            auto scan = sc.scan_while(always);
            for(auto&& x : scan) {
                if(x == 3) {
                    break;
                }
            }
        }
        VERIFY(sc.position() == 4);
        VERIFY(*sc.peek() == 4);

        VERIFY((sc.rest() % as_ints{} == vec_t{4, 5, 6, 7}));
    };

    tests["scanner: moved scanner keeps its position"] = [=]
    {
        auto sc1 = fn::scanner(make_inputs({1, 2, 3}));
        auto scan = sc1.scan_while([](const X& x) { return x < 3; });

        auto sc2 = std::move(sc1);
        VERIFY((scan % as_ints{} == vec_t{1, 2}));
        VERIFY((sc2.rest() % as_ints{} == vec_t{3}));
    };

    /////////////////////////////////////////////////////////////////////////

    tests["sectionize"] = [=]
    {
        auto res = drain_sections(make_inputs({-1, 0, 1, 2, -2, 3, 4}) % fn::sectionize(is_negative{}));
        VERIFY((res == sections_t{ {-1, {0, 1, 2}}, {-2, {3, 4}} }));
    };

    tests["sectionize: adjacent markers"] = [=]
    {
        auto res = drain_sections(make_inputs({-1, -2}) % fn::sectionize(is_negative{}));
        VERIFY((res == sections_t{ {-1, {}}, {-2, {}} }));
    };

    tests["sectionize: empty input"] = [=]
    {
        auto res = drain_sections(make_inputs({}) % fn::sectionize(is_negative{}));
        VERIFY(res.empty());
    };

    tests["sectionize: input not starting with a marker"] = [=]
    {
        bool thrown = false;
        try {
            auto sections = make_inputs({0, -2, 3, 4}) % fn::sectionize(is_negative{});
            sections.begin();
        } catch(const fn::structure_error& e) {
            thrown = std::string(e.what()).find("expected a section, but found: 0") != std::string::npos;
        }
        VERIFY(thrown);
    };

    tests["sectionize: undrained section"] = [=]
    {
        auto sections = make_inputs({-1, 0, 1, -2, 3}) % fn::sectionize(is_negative{});

        auto it = sections.begin();
        VERIFY(it != sections.end());
        VERIFY(int(it->first) == -1);

        bool thrown = false;
        try {
            ++it;
        } catch(const fn::state_error&) {
            thrown = true;
        }
        VERIFY(thrown);

        // nothing was lost: drain the section, then advance
        VERIFY((as_ints{}(it->second) == vec_t{0, 1}));

        ++it;
        VERIFY(it != sections.end());
        VERIFY(int(it->first) == -2);
        VERIFY((as_ints{}(it->second) == vec_t{3}));

        ++it;
        VERIFY(it == sections.end());
    };

    tests["sectionize: partially drained section"] = [=]
    {
        auto sections = make_inputs({-1, 0, 1, 2, -2}) % fn::sectionize(is_negative{});

        auto it = sections.begin();
        VERIFY((std::move(it->second) % fn::take_first(2) % as_ints{} == vec_t{0, 1}));

        bool thrown = false;
        try {
            ++it;
        } catch(const fn::state_error& e) {
            thrown = std::string(e.what()).find("pending element: 2") != std::string::npos;
        }
        VERIFY(thrown);
    };

    tests["sectionize: untouched empty section"] = [=]
    {
        auto sections = make_inputs({-1, -2, 5}) % fn::sectionize(is_negative{});

        auto it = sections.begin();
        ++it; // the subseq of -1 has nothing left, so this is allowed
        VERIFY(int(it->first) == -2);

        bool thrown = false;
        try {
            ++it; // but 5 is still pending in the subseq of -2
        } catch(const fn::state_error&) {
            thrown = true;
        }
        VERIFY(thrown);
    };

    tests["sectionize: stale subseq"] = [=]
    {
        auto sections = make_inputs({-1, -2, 3}) % fn::sectionize(is_negative{});

        auto it = sections.begin();
        auto stale = std::move(it->second);
        ++it;

        VERIFY(as_ints{}(stale).empty());
        VERIFY((as_ints{}(it->second) == vec_t{3}));
    };

    /////////////////////////////////////////////////////////////////////////

    tests["isort"] = [=]
    {
        VERIFY((make_inputs({1, 4, 9, 2, 5, 3, 7, 8, 0, 6}) % fn::isort(1) % as_ints{} == vec_t{1, 4, 2, 5, 3, 7, 8, 0, 6, 9}));
        VERIFY((make_inputs({1, 4, 9, 2, 5, 3, 7, 8, 0, 6}) % fn::isort(3) % as_ints{} == vec_t{1, 2, 3, 4, 5, 0, 6, 7, 8, 9}));
        VERIFY((make_inputs({1, 4, 9, 2, 5, 3, 7, 8, 0, 6}) % fn::isort(6) % as_ints{} == vec_t{1, 2, 0, 3, 4, 5, 6, 7, 8, 9}));
        VERIFY((make_inputs({1, 4, 9, 2, 5, 3, 7, 8, 0, 6}) % fn::isort(8) % as_ints{} == vec_t{0, 1, 2, 3, 4, 5, 6, 7, 8, 9}));
        VERIFY((make_inputs({1, 4, 9, 2, 5, 3, 7, 8, 0, 6}) % fn::isort()  % as_ints{} == vec_t{0, 1, 2, 3, 4, 5, 6, 7, 8, 9}));
    };

    tests["isort: short and empty inputs"] = [=]
    {
        VERIFY((make_inputs({3, 1, 2}) % fn::isort(5) % as_ints{} == vec_t{1, 2, 3}));
        VERIFY((make_inputs({3, 1, 2}) % fn::isort(3) % as_ints{} == vec_t{1, 2, 3}));
        VERIFY((make_inputs({}) % fn::isort(3) % as_ints{}).empty());

        // the window grows with the input, not with bufsize
        VERIFY((make_inputs({3, 1, 2}) % fn::isort(std::numeric_limits<std::ptrdiff_t>::max()) % as_ints{} == vec_t{1, 2, 3}));
        VERIFY((make_inputs({3, 1, 2}) % fn::isort(std::numeric_limits<std::ptrdiff_t>::max() / 2) % as_ints{} == vec_t{1, 2, 3}));
    };

    tests["isort_by"] = [=]
    {
        // equal keys come out in order of arrival: 4 before 2, 1 before 5, 0 before 6
        VERIFY((make_inputs({1, 4, 9, 2, 5, 3, 7, 8, 0, 6}) % fn::isort_by(5, dist_from_3{}) % as_ints{} == vec_t{3, 4, 2, 1, 5, 0, 6, 7, 8, 9}));
    };

    tests["isort: larger window never orders worse"] = [=]
    {
        size_t prev_num_ordered = 0;

        for(std::ptrdiff_t bufsize = 1; bufsize <= 12; bufsize++) {
            const auto res = make_inputs({1, 4, 9, 2, 5, 3, 7, 8, 0, 6}) % fn::isort(bufsize) % as_ints{};
            VERIFY(res.size() == 10);

            size_t num_ordered = 0;
            for(size_t i = 1; i < res.size(); i++) {
                num_ordered += res[i - 1] <= res[i] ? 1 : 0;
            }

            VERIFY(num_ordered >= prev_num_ordered);
            prev_num_ordered = num_ordered;
        }
        VERIFY(prev_num_ordered == 9);
    };

    /////////////////////////////////////////////////////////////////////////

    tests["grouper: bare pairs of move-only values"] = [=]
    {
        auto runs = make_inputs({11, 12, 21, 13, 31, 32})
          % fn::transform(by_tens{})
          % fn::grouper(fn::bare())
          % fn::to_vector();

        VERIFY(runs.size() == 4); // key 1 appears in two separate runs
        VERIFY(runs[0].first == 1);
        VERIFY((as_ints{}(runs[0].second) == vec_t{11, 12}));
        VERIFY(runs[1].first == 2);
        VERIFY((as_ints{}(runs[1].second) == vec_t{21}));
        VERIFY(runs[2].first == 1);
        VERIFY((as_ints{}(runs[2].second) == vec_t{13}));
        VERIFY(runs[3].first == 3);
        VERIFY((as_ints{}(runs[3].second) == vec_t{31, 32}));
    };

    tests["grouper: empty input"] = [=]
    {
        auto runs = make_inputs({})
          % fn::transform(by_tens{})
          % fn::grouper(fn::bare())
          % fn::to_vector();

        VERIFY(runs.empty());
    };

    /////////////////////////////////////////////////////////////////////////

    tests["side_effect"] = [=]
    {
        vec_t seen{};
        auto res = make_inputs({1, 2, 3, 4})
          % fn::side_effect([&seen](const X& x) { seen.push_back(int(x)); })
          % fn::take_first(2)
          % as_ints{};

        VERIFY((res == vec_t{1, 2}));
        VERIFY((seen == vec_t{1, 2}));
    };

    tests["icompact"] = [=]
    {
        VERIFY((make_inputs({0, 1, 0, 2, 3, 0}) % fn::icompact() % as_ints{} == vec_t{1, 2, 3}));
    };

    return tests;
}


/////////////////////////////////////////////////////////////////////////////
/////////////////////////////////////////////////////////////////////////////
/////////////////////////////////////////////////////////////////////////////
static void run_tests()
{
    using fn::operators::operator%;

    std::map<std::string, std::function<void()>> test_cont{}, test_seq{}, test_other{};

    // battery where inputs are containers
    test_cont = make_tests([](std::initializer_list<int> xs)
    {
        Xs ret;
        for(auto x : xs) {
            ret.push_back(X(x));
        }
        return ret;
    });

    // battery where inputs are lazy seqs
    test_seq = make_tests([](std::initializer_list<int> xs)
    {
        Xs ret;
        for(auto x : xs) {
            ret.push_back(X(x));
        }
        return fn::to_seq()(std::move(ret));
    });

    /////////////////////////////////////////////////////////////////////////

    test_other["seq from a generator function"] = [&]
    {
        int i = 0;
        auto res = fn::seq([&i]() -> int
        {
            return i < 5 ? i++ : fn::end_seq();
        })
      % fn::where([](int x)
        {
            return x > 1;
        })
      % fn::to_vector();

        VERIFY((res == vec_t{2, 3, 4}));
    };

    test_other["seq: begin() is once-callable"] = [&]
    {
        auto s = vec_t{1, 2} % fn::to_seq();
        s.begin();

        bool thrown = false;
        try {
            s.begin();
        } catch(const std::logic_error&) {
            thrown = true;
        }
        VERIFY(thrown);

        s.set_resumable();
        VERIFY(*s.begin() == 1);
    };

    test_other["any_seq_t"] = [&]
    {
        int i = 0;
        fn::any_seq_t<int> s = fn::seq([&i]() -> int
        {
            return i < 3 ? i++ : fn::end_seq();
        });

        VERIFY((std::move(s) % fn::transform([](int x) { return x * 10; }) % fn::to_vector() == vec_t{0, 10, 20}));
    };

    test_other["any_seq_t composes with the stages"] = [&]
    {
        auto make_inputs = []() -> fn::any_seq_t<int>
        {
            return vec_t{-1, 5, 3, -2, 9, 1} % fn::to_seq();
        };
        auto is_positive = [](int x) { return x > 0; };

        VERIFY((make_inputs() % fn::where(is_positive) % fn::to_vector() == vec_t{5, 3, 9, 1}));
        VERIFY((make_inputs() % fn::where(is_positive) % fn::isort(2) % fn::to_vector() == vec_t{3, 1, 5, 9}));
        VERIFY((make_inputs() % fn::isort(10) % fn::to_vector() == vec_t{-2, -1, 1, 3, 5, 9}));
        VERIFY((make_inputs() % fn::take_first(2) % fn::to_vector() == vec_t{-1, 5}));
        VERIFY((make_inputs() % fn::compact() == vec_t{-1, 5, 3, -2, 9, 1}));

        sections_t res{};
        auto sections = make_inputs() % fn::sectionize([](int x) { return x < 0; });
        for(auto&& sec : sections) {
            res.emplace_back(sec.first, std::move(sec.second) % fn::to_vector());
        }
        VERIFY((res == sections_t{ {-1, {5, 3}}, {-2, {9, 1}} }));
    };

    /////////////////////////////////////////////////////////////////////////

    test_other["scanner over string tokens"] = [&]
    {
        auto is_int = [](const std::string& s) { return !s.empty() && std::isdigit(static_cast<unsigned char>(s[0])); };
        auto is_dot = [](const std::string& s) { return s == "."; };

        using strs_t = std::vector<std::string>;

        auto sc = fn::scanner(strs_t{ "a", "0", "b", "1", "2", "c", "d", "3", "4", "." });

        VERIFY(sc.skip_until(is_int) == 1);
        VERIFY(sc.skip_while(is_int) == 1);
        VERIFY(sc.skip_until(is_int) == 1);
        VERIFY((sc.scan_while(is_int) % fn::to_vector() == strs_t{ "1", "2" }));
        VERIFY(sc.skip_until(is_dot) == 4);
        VERIFY((sc.scan_while(is_dot) % fn::to_vector() == strs_t{ "." }));
        VERIFY(!sc);
    };

    test_other["scan_until is scan_while of the inverted predicate"] = [&]
    {
        auto is_big = [](int x) { return x > 2; };

        auto sc1 = fn::scanner(vec_t{0, 1, 2, 3, 4});
        auto sc2 = fn::scanner(vec_t{0, 1, 2, 3, 4});

        VERIFY((sc1.scan_until(is_big) % fn::to_vector() == sc2.scan_while(fn::invert(is_big)) % fn::to_vector()));
        VERIFY((sc1.rest() % fn::to_vector() == vec_t{3, 4}));
        VERIFY((sc2.rest() % fn::to_vector() == vec_t{3, 4}));
    };

    test_other["scanner over a seq pulls lazily"] = [&]
    {
        int num_pulled = 0;
        auto sc = fn::scanner(fn::seq([&num_pulled]() -> int
        {
            return num_pulled < 100 ? num_pulled++ : fn::end_seq();
        }));

        VERIFY(num_pulled == 0);
        VERIFY(sc.skip_while([](int x) { return x < 10; }) == 10);
        VERIFY(num_pulled == 11); // 10 is peeked, not consumed
        VERIFY(sc.position() == 10);
        VERIFY(*sc.next() == 10);
        VERIFY(num_pulled == 11);
    };

    /////////////////////////////////////////////////////////////////////////

    test_other["sectionize over strings"] = [&]
    {
        auto is_section = [](const std::string& s) { return !s.empty() && std::isalpha(static_cast<unsigned char>(s[0])); };

        using strs_t = std::vector<std::string>;
        using secs_t = std::vector<std::pair<std::string, strs_t>>;

        {
            secs_t res{};
            auto sections = strs_t{ "A", "0", "1", "2", "B", "3", "4" } % fn::sectionize(is_section);
            for(auto&& sec : sections) {
                res.emplace_back(sec.first, std::move(sec.second) % fn::to_vector());
            }
            VERIFY((res == secs_t{ {"A", {"0", "1", "2"}}, {"B", {"3", "4"}} }));
        }

        {
            secs_t res{};
            auto sections = strs_t{ "A", "B" } % fn::sectionize(is_section);
            for(auto&& sec : sections) {
                res.emplace_back(sec.first, std::move(sec.second) % fn::to_vector());
            }
            VERIFY((res == secs_t{ {"A", {}}, {"B", {}} }));
        }

        {
            std::string what{};
            try {
                auto sections = strs_t{ "0", "B", "3", "4" } % fn::sectionize(is_section);
                for(auto&& sec : sections) {
                    (void)sec;
                }
            } catch(const fn::structure_error& e) {
                what = e.what();
            }
            VERIFY(what.find("expected a section, but found: 0") != std::string::npos);
        }

        {
            // collecting markers only, without consuming the subseqs
            strs_t markers{};
            bool thrown = false;
            try {
                auto sections = strs_t{ "A", "0", "1", "2", "B", "3", "4" } % fn::sectionize(is_section);
                for(auto&& sec : sections) {
                    markers.push_back(sec.first);
                }
            } catch(const fn::state_error&) {
                thrown = true;
            }
            VERIFY(thrown);
            VERIFY((markers == strs_t{ "A" }));
        }
    };

    /////////////////////////////////////////////////////////////////////////

    test_other["isort: bufsize must be positive"] = [&]
    {
        for(std::ptrdiff_t bufsize : { 0, -1 }) {
            bool thrown = false;
            try {
                fn::isort(bufsize);
            } catch(const fn::config_error&) {
                thrown = true;
            }
            VERIFY(thrown);
        }

        bool thrown = false;
        try {
            fn::isort_by(0, fn::by::first{});
        } catch(const fn::config_error&) {
            thrown = true;
        }
        VERIFY(thrown);
    };

    test_other["isort: equal keys in order of arrival"] = [&]
    {
        using kv_t = std::pair<int, char>;

        auto res = std::vector<kv_t>{ {1, 'a'}, {0, 'b'}, {1, 'c'}, {1, 'd'}, {0, 'e'} }
          % fn::isort_by(2, fn::by::first{})
          % fn::transform([](kv_t kv) { return kv.second; })
          % fn::to_vector();

        VERIFY((res == std::vector<char>{ 'b', 'a', 'e', 'c', 'd' }));
    };

    test_other["isort: only keys are compared"] = [&]
    {
        struct no_less
        {
            std::string name;
        };
        using item_t = std::pair<int, no_less>;

        std::vector<item_t> items{};
        items.push_back(item_t{ 2, no_less{ "two" } });
        items.push_back(item_t{ 1, no_less{ "one" } });
        items.push_back(item_t{ 2, no_less{ "deux" } });
        items.push_back(item_t{ 1, no_less{ "un" } });

        std::vector<std::string> names{};
        std::move(items)
          % fn::isort_by(4, fn::by::first{})
          % fn::for_each([&names](item_t item)
            {
                names.push_back(item.second.name);
            });

        VERIFY((names == std::vector<std::string>{ "one", "un", "two", "deux" }));
    };

    test_other["isort: key-function returning reference_wrapper"] = [&]
    {
        using item_t = std::pair<std::string, int>;

        auto res = std::vector<item_t>{ {"b", 1}, {"a", 2}, {"b", 3}, {"a", 4} }
          % fn::isort_by(4, [](const item_t& item)
            {
                return std::cref(item.first);
            })
          % fn::transform([](item_t item) { return item.second; })
          % fn::to_vector();

        VERIFY((res == vec_t{2, 4, 1, 3}));
    };

    test_other["isort: window is bounded"] = [&]
    {
        int num_pulled = 0;
        auto sorted = fn::seq([&num_pulled]() -> int
        {
            return num_pulled < 100 ? 99 - num_pulled++ : fn::end_seq();
        })
      % fn::isort(10);

        // the window holds 99..90; the 11th element, 89, precedes all of them
        auto it = sorted.begin();
        VERIFY(*it == 89);
        VERIFY(num_pulled == 11);
    };

    /////////////////////////////////////////////////////////////////////////

    test_other["grouper: tuples"] = [&]
    {
        using row_t  = std::tuple<int, int, int>;
        using rest_t = std::tuple<int, int>;
        using runs_t = std::vector<std::pair<int, std::vector<rest_t>>>;

        auto res = std::vector<row_t>{ std::make_tuple(1, 2, 3), std::make_tuple(1, 5, 7), std::make_tuple(2, 5, 7) }
          % fn::grouper()
          % fn::to_vector();

        VERIFY((res == runs_t{ { 1, { std::make_tuple(2, 3), std::make_tuple(5, 7) } },
                               { 2, { std::make_tuple(5, 7) } } }));
    };

    test_other["grouper: bare"] = [&]
    {
        using runs_t = std::vector<std::pair<int, vec_t>>;

        auto res = std::vector<std::pair<int, int>>{ {1, 2}, {1, 5}, {2, 5} }
          % fn::grouper(fn::bare())
          % fn::to_vector();

        VERIFY((res == runs_t{ {1, {2, 5}}, {2, {5}} }));
    };

    test_other["grouper: non-adjacent equal keys are separate runs"] = [&]
    {
        using runs_t = std::vector<std::pair<int, std::vector<char>>>;

        auto res = std::vector<std::pair<int, char>>{ {1, 'a'}, {2, 'b'}, {1, 'c'} }
          % fn::grouper(fn::bare())
          % fn::to_vector();

        VERIFY((res == runs_t{ {1, {'a'}}, {2, {'b'}}, {1, {'c'}} }));
    };

    test_other["grouper: default-valued keys"] = [&]
    {
        using runs_t = std::vector<std::pair<std::string, vec_t>>;

        auto res = std::vector<std::pair<std::string, int>>{ {"", 1}, {"", 2}, {"x", 3}, {"", 4} }
          % fn::grouper(fn::bare())
          % fn::to_vector();

        VERIFY((res == runs_t{ {"", {1, 2}}, {"x", {3}}, {"", {4}} }));
    };

    test_other["grouper: pairs without bare"] = [&]
    {
        using runs_t = std::vector<std::pair<int, std::vector<std::tuple<char>>>>;

        auto res = std::vector<std::pair<int, char>>{ {1, 'a'}, {1, 'b'}, {2, 'c'} }
          % fn::grouper()
          % fn::to_vector();

        VERIFY((res == runs_t{ { 1, { std::make_tuple('a'), std::make_tuple('b') } },
                               { 2, { std::make_tuple('c') } } }));
    };

    test_other["grouper: keys held by reference_wrapper"] = [&]
    {
        const std::vector<std::string> names{ "x", "x", "y" }; // equal values, distinct objects
        using row_t = std::pair<std::reference_wrapper<const std::string>, int>;

        auto res = std::vector<row_t>{ { std::cref(names[0]), 1 }, { std::cref(names[1]), 2 }, { std::cref(names[2]), 3 } }
          % fn::grouper(fn::bare())
          % fn::to_vector();

        VERIFY(res.size() == 2);
        VERIFY(res[0].first.get() == "x");
        VERIFY((res[0].second == vec_t{1, 2}));
        VERIFY(res[1].first.get() == "y");
        VERIFY((res[1].second == vec_t{3}));
    };

    test_other["grouper: single-column tuples"] = [&]
    {
        auto res = std::vector<std::tuple<int>>{ std::make_tuple(7), std::make_tuple(7), std::make_tuple(8) }
          % fn::grouper()
          % fn::to_vector();

        VERIFY(res.size() == 2);
        VERIFY(res[0].first == 7 && res[0].second.size() == 2);
        VERIFY(res[1].first == 8 && res[1].second.size() == 1);
    };

    /////////////////////////////////////////////////////////////////////////

    test_other["compact"] = [&]
    {
        VERIFY((vec_t{0, 1, 2} % fn::compact() == vec_t{1, 2}));

        using strs_t = std::vector<std::string>;
        VERIFY((strs_t{ "thing", "", "bar", "" } % fn::compact() == strs_t{ "thing", "bar" }));

        int n = 42;
        auto ptrs = std::vector<int*>{ nullptr, &n, nullptr } % fn::compact();
        VERIFY(ptrs.size() == 1 && ptrs[0] == &n);

        auto flags = std::vector<bool>{ true, false, true } % fn::icompact() % fn::to_vector();
        VERIFY(flags.size() == 2);

        std::vector<vec_t> vecs{ {}, {1}, {}, {2, 3} };
        VERIFY((std::move(vecs) % fn::compact() == std::vector<vec_t>{ {1}, {2, 3} }));
    };

    test_other["compact_dict"] = [&]
    {
        using map_t = std::map<std::string, int>;
        VERIFY((fn::compact_dict(map_t{ {"a", 0}, {"b", 0}, {"c", 0}, {"d", 7} }) == map_t{ {"d", 7} }));

        using smap_t = std::map<int, std::string>;
        VERIFY((fn::compact_dict(smap_t{ {1, ""}, {2, "bananas"} }) == smap_t{ {2, "bananas"} }));
    };

    test_other["freq"] = [&]
    {
        using strs_t = std::vector<std::string>;
        using counts_t = std::map<std::string, size_t>;

        const auto words = strs_t{ "foo", "bar", "baz", "foo", "bar" };

        VERIFY((words % fn::freq() == counts_t{ {"foo", 2}, {"bar", 2}, {"baz", 1} }));
        VERIFY((words % fn::freq(2) == counts_t{ {"foo", 2}, {"bar", 2} }));

        auto initial = [](const std::string& s)
        {
            return char(std::toupper(static_cast<unsigned char>(s[0])));
        };
        VERIFY((words % fn::freq_by(initial) == std::map<char, size_t>{ {'B', 3}, {'F', 2} }));

        VERIFY((fn::seq([]() -> int { return fn::end_seq(); }) % fn::freq()).empty());
    };

    test_other["side_effect in chunks"] = [&]
    {
        auto sum = [](const vec_t& xs)
        {
            return std::accumulate(xs.begin(), xs.end(), 0);
        };

        vec_t c{}, d{};
        auto res = vec_t{0, 1, 2, 3, 4, 5, 6, 7, 8, 9}
          % fn::side_effect([&](const vec_t& xs) { c.push_back(sum(xs)); }, 2)
          % fn::side_effect([&](const vec_t& xs) { d.push_back(sum(xs)); }, 3)
          % fn::to_vector();

        VERIFY((res == vec_t{0, 1, 2, 3, 4, 5, 6, 7, 8, 9}));
        VERIFY((c == vec_t{1, 5, 9, 13, 17}));
        VERIFY((d == vec_t{3, 12, 21, 9}));

        bool thrown = false;
        try {
            fn::side_effect([](const vec_t&) {}, 0);
        } catch(const fn::config_error&) {
            thrown = true;
        }
        VERIFY(thrown);
    };

    test_other["side_effect: progress of a partially consumed seq"] = [&]
    {
        vec_t chunk_sizes{};
        auto res = vec_t{0, 1, 2, 3, 4, 5, 6}
          % fn::side_effect([&chunk_sizes](const vec_t& xs) { chunk_sizes.push_back(int(xs.size())); }, 3)
          % fn::take_first(4)
          % fn::to_vector();

        VERIFY((res == vec_t{0, 1, 2, 3}));
        VERIFY((chunk_sizes == vec_t{3, 3}));
    };

    /////////////////////////////////////////////////////////////////////////
    size_t num_failed = 0;
    size_t num_ok = 0;
    for(auto&& tests : { test_cont, test_seq, test_other })
        for(const auto& kv : tests)
    {
        try {
            kv.second();
            num_ok++;
        } catch(const std::exception& e) {
            num_failed++;
            std::cerr << "Failed test '" << kv.first << "' :" << e.what() << "\n";
        }
    }

    if(num_failed == 0) {
        std::cerr << "Ran " << num_ok << " tests - OK\n";
    } else {
        throw std::runtime_error(std::to_string(num_failed) + " tests failed.");
    }
}

} // namespace impl
} // namespace fn
} // namespace itermore

#endif // ITERMORE_FN_ENABLE_RUN_TESTS

#if defined(_MSC_VER)
#   pragma warning(pop)
#endif

#endif // #ifndef ITERMORE_FN_HPP_
