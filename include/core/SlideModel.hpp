#pragma once
/** @file  SlideModel.hpp
 *  @brief Ordered slide list and its JSON project document.
 *
 *  © 2025 Dahu — MIT-licensed.
 */

// STL headers
#include <cstddef>
#include <iterator>
#include <memory>
#include <string>
#include <vector>

// 3rd-party headers
#include <nlohmann/json.hpp>

namespace dahu::core {

  /** One captured moment: image identifier plus cursor position at capture time. */
  struct Slide {
    std::string imagePath;
    int cursorX{ 0 };
    int cursorY{ 0 };

    bool operator==(const Slide&) const = default;
  };

  /**
 * @class SlidePathSequence
 * @brief Read-only view of the image paths of a slide snapshot.
 *
 *  * Shares the snapshot with the model, so later model mutations are not seen.
 *  * Can be iterated any number of times; each begin() restarts from the first slide.
 */
  class SlidePathSequence {
  public:
    class iterator {
    public:
      using iterator_category = std::forward_iterator_tag;
      using value_type = std::string;
      using difference_type = std::ptrdiff_t;
      using pointer = const std::string*;
      using reference = const std::string&;

      iterator() = default;
      explicit iterator(std::vector<Slide>::const_iterator it) : it_(it) {}

      reference operator*() const { return it_->imagePath; }
      pointer operator->() const { return &it_->imagePath; }
      iterator& operator++() {
        ++it_;
        return *this;
      }
      iterator operator++(int) {
        iterator tmp = *this;
        ++it_;
        return tmp;
      }
      bool operator==(const iterator& other) const { return it_ == other.it_; }

    private:
      std::vector<Slide>::const_iterator it_{};
    };

    explicit SlidePathSequence(std::shared_ptr<const std::vector<Slide>> snapshot)
        : snapshot_(std::move(snapshot)) {}

    iterator begin() const { return iterator(snapshot_->begin()); }
    iterator end() const { return iterator(snapshot_->end()); }
    std::size_t size() const { return snapshot_->size(); }
    bool empty() const { return snapshot_->empty(); }

    /// Materializes the sequence, mostly for comparisons in callers.
    std::vector<std::string> toVector() const { return std::vector<std::string>(begin(), end()); }

  private:
    std::shared_ptr<const std::vector<Slide>> snapshot_;
  };

  /**
 * @class SlideModel
 * @brief Insertion-ordered slide sequence; insertion order is presentation order.
 *
 *  * Copy-on-write storage: every mutation swaps in a new vector, so snapshots
 *    handed out by slidePaths() stay stable.
 *  * Every mutator is all-or-nothing and throws `EditorError` on bad input.
 */
  class SlideModel {
  public:
    SlideModel();

    static SlideModel createEmpty() { return SlideModel{}; }

    //---public API------------------------------------------------------
    /// Append a slide. Throws InvalidSlideData on an empty image path.
    Slide addSlide(const std::string& imagePath, int x, int y);

    /// Serialize as `{ "slides": [ {path, x, y}, ... ] }`.
    nlohmann::json toDocument() const;
    std::string toText() const; ///< toDocument() dumped as indented UTF-8 text

    /// Replace the whole sequence. Throws MalformedProjectDocument and keeps
    /// the previous sequence when \p doc does not match the document shape.
    void fromDocument(const nlohmann::json& doc);
    void fromText(const std::string& text);

    SlidePathSequence slidePaths() const { return SlidePathSequence(slides_); }

    const std::vector<Slide>& slides() const { return *slides_; }
    const Slide& at(std::size_t index) const { return slides_->at(index); }
    std::size_t size() const { return slides_->size(); }
    bool empty() const { return slides_->empty(); }
    void clear();

  private:
    static Slide parseSlide(const nlohmann::json& entry, std::size_t index);

    std::shared_ptr<const std::vector<Slide>> slides_;
  };

} // namespace dahu::core
