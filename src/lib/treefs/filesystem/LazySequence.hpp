#ifndef LIBTFS_LAZYSEQUENCE_H_
#define LIBTFS_LAZYSEQUENCE_H_

#include <cstddef>
#include <functional>
#include <iterator>
#include <list>
#include <memory>
#include <optional>
#include <utility>

namespace TreeFS {
namespace Filesystem {

/**
 * A pull-based sequence whose elements are produced on demand
 * Producing an element may perform I/O, so any call that pulls an element
 * (Next, begin, Iterator++, ToList) may throw the producer's exceptions.
 * A sequence that threw is not retried, the caller may only report the failure.
 * NOT THREAD SAFE
 */
template<typename T>
class LazySequence
{
public:

    /** Function returning the next element or nullopt at the end */
    using NextFunc = std::function<std::optional<T> ()>;

    /** @param next function producing the elements */
    explicit LazySequence(NextFunc next) : mNext(std::move(next)) { }

    /** Returns the next element or nullopt if there are no more */
    std::optional<T> Next()
    {
        if (mDone) return std::nullopt;

        std::optional<T> retval { mNext() };
        if (!retval) mDone = true;
        return retval;
    }

    /** Returns a sequence of only the elements matching pred (consumes this one) */
    template<typename Pred>
    LazySequence Filter(Pred pred) &&
    {
        const std::shared_ptr<LazySequence> seq { std::make_shared<LazySequence>(std::move(*this)) };
        return LazySequence([seq,pred]()->std::optional<T>
        {
            for (std::optional<T> val { seq->Next() }; val; val = seq->Next())
                if (pred(*val)) return val;
            return std::nullopt;
        });
    }

    /** Returns a sequence of func applied to each element (consumes this one) */
    template<typename U, typename Func>
    LazySequence<U> Map(Func func) &&
    {
        const std::shared_ptr<LazySequence> seq { std::make_shared<LazySequence>(std::move(*this)) };
        return LazySequence<U>([seq,func]()->std::optional<U>
        {
            std::optional<T> val { seq->Next() };
            if (!val) return std::nullopt;
            return func(*val);
        });
    }

    /** Pulls all remaining elements into a list */
    std::list<T> ToList()
    {
        std::list<T> retval;
        for (std::optional<T> val { Next() }; val; val = Next())
            retval.push_back(std::move(*val));
        return retval;
    }

    /** Input iterator for range-based for loops, pulls as it is incremented */
    class Iterator
    {
    public:
        using iterator_category = std::input_iterator_tag;
        using value_type = T;
        using difference_type = std::ptrdiff_t;
        using pointer = T*;
        using reference = T&;

        /** Construct the end iterator */
        Iterator() = default;

        /** Construct an iterator at the next element of seq */
        explicit Iterator(LazySequence& seq) : mSeq(&seq) { Pull(); }

        reference operator*() { return *mValue; }
        pointer operator->() { return &(*mValue); }

        Iterator& operator++() { Pull(); return *this; }

        bool operator==(const Iterator& it) const { return mSeq == it.mSeq; }
        bool operator!=(const Iterator& it) const { return mSeq != it.mSeq; }

    private:

        /** Gets the next value, becoming the end iterator if there is none */
        void Pull()
        {
            mValue = mSeq->Next();
            if (!mValue) mSeq = nullptr;
        }

        LazySequence* mSeq { nullptr };
        std::optional<T> mValue;
    };

    /** Returns an iterator at the next element (pulls it!) */
    Iterator begin() { return Iterator(*this); }

    /** Returns the end iterator */
    Iterator end() { return Iterator(); }

private:

    NextFunc mNext;

    /** true if the end has been reached */
    bool mDone { false };
};

} // namespace Filesystem
} // namespace TreeFS

#endif // LIBTFS_LAZYSEQUENCE_H_
