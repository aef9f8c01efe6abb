// avl_order_stat_map.hpp
// AVL tree map with order statistics: every node caches the height and the node count of its subtree,
// so kth_largest(k) / kth_smallest(k) run in O(log N) without a traversal.
//
// - C++17 header-only.
// - Nodes are allocated through an allocator rebound from Alloc. Ownership is strictly hierarchical:
//   a node owns its two children, there are no parent pointers and no sentinel.
// - insert / erase recurse to the target position and rewire child links from the returned subtree roots
//   on the way back up, refreshing height/count and rebalancing every ancestor.
// - Errors are reported by exception (see ostree_errors.hpp) and are detected before anything is
//   modified, so a failed insert/erase/query leaves the map exactly as it was.
// - Iterators are forward iterators in ascending key order. Each carries its own stack of pending
//   ancestors; any mutation of the map invalidates all iterators.
//
// Diagnostics:
//     * validate_invariants_json(std::string& out_json) const
//         - Validates BST order, cached height, cached subtree count, AVL balance and size.
//         - Produces a structured JSON diagnostics object describing validity, issues, node count,
//           height, rotation count and a node list with (key, height, count, balance, left, right).
//     * validate_invariants(std::string* out) const
//         - Human-readable wrapper around the JSON output, followed by a tree dump.
//     * tree_dump(std::ostream& os, bool show_addresses = false) const
//         - Pretty-prints the tree structure with indentation, cached fields and (optionally) node addresses.
//   The diagnostic helpers assume Key is streamable (operator<<); they are only instantiated when called.
//
// Usage in tests:
//   AVLOrderStatMap<int,int> m;
//   ... operations ...
//   std::string diag_json;
//   ASSERT_TRUE(m.validate_invariants_json(diag_json)) << diag_json;
//   EXPECT_EQ(m.kth_largest(1).first, largest_key);

#ifndef OSTREE_AVL_ORDER_STAT_MAP_HPP
#define OSTREE_AVL_ORDER_STAT_MAP_HPP

#include <memory>
#include <utility>
#include <functional>
#include <initializer_list>
#include <iterator>
#include <type_traits>
#include <limits>
#include <iomanip>
#include <iostream>
#include <string>
#include <sstream>
#include <vector>
#include <queue>
#include <algorithm>
#include <cstdint>
#include <cstdlib>

#include "ostree_errors.hpp"

template <
    typename Key,
    typename T,
    typename Compare = std::less<Key>,
    typename Alloc = std::allocator<std::pair<const Key, T>>
>
class AVLOrderStatMap {
public:
    // STL-like typedefs
    using key_type        = Key;
    using mapped_type     = T;
    using value_type      = std::pair<const Key, T>;
    using key_compare     = Compare;
    using allocator_type  = Alloc;
    using size_type       = std::size_t;
    using difference_type = std::ptrdiff_t;

private:
    // height and count describe the subtree rooted here; a leaf has height 1 and count 1.
    struct Node {
        value_type value;
        Node* left;
        Node* right;
        int height;
        size_type count;
        Node(const value_type& v)
            : value(v), left(nullptr), right(nullptr), height(1), count(1) {}
        Node(value_type&& v)
            : value(std::move(v)), left(nullptr), right(nullptr), height(1), count(1) {}
    };

    using AllocTraits = std::allocator_traits<allocator_type>;
    using NodeAlloc = typename AllocTraits::template rebind_alloc<Node>;
    using NodeAllocTraits = std::allocator_traits<NodeAlloc>;

public:
    class const_iterator;
    class iterator {
        friend class AVLOrderStatMap;
        friend class const_iterator;
    public:
        using iterator_category = std::forward_iterator_tag;
        using value_type        = AVLOrderStatMap::value_type;
        using reference         = value_type&;
        using pointer           = value_type*;
        using difference_type   = AVLOrderStatMap::difference_type;

        iterator() = default;
        reference operator*() const { return stack_.back()->value; }
        pointer operator->() const { return &stack_.back()->value; }

        iterator& operator++() { step_forward(stack_); return *this; }
        iterator operator++(int) { iterator tmp = *this; ++(*this); return tmp; }

        bool operator==(const iterator& o) const { return current() == o.current(); }
        bool operator!=(const iterator& o) const { return current() != o.current(); }

    private:
        std::vector<Node*> stack_;
        explicit iterator(Node* root) { push_left(stack_, root); }
        Node* current() const { return stack_.empty() ? nullptr : stack_.back(); }
    };

    class const_iterator {
        friend class AVLOrderStatMap;
    public:
        using iterator_category = std::forward_iterator_tag;
        using value_type        = AVLOrderStatMap::value_type;
        using reference         = const value_type&;
        using pointer           = const value_type*;
        using difference_type   = AVLOrderStatMap::difference_type;

        const_iterator() = default;
        const_iterator(const iterator& it) : stack_(it.stack_.begin(), it.stack_.end()) {}
        reference operator*() const { return stack_.back()->value; }
        pointer operator->() const { return &stack_.back()->value; }

        const_iterator& operator++() { step_forward(stack_); return *this; }
        const_iterator operator++(int) { const_iterator tmp = *this; ++(*this); return tmp; }

        bool operator==(const const_iterator& o) const { return current() == o.current(); }
        bool operator!=(const const_iterator& o) const { return current() != o.current(); }

    private:
        std::vector<const Node*> stack_;
        explicit const_iterator(const Node* root) { push_left(stack_, root); }
        const Node* current() const { return stack_.empty() ? nullptr : stack_.back(); }
    };

    // constructors / destructor / assignment
    explicit AVLOrderStatMap(const key_compare& comp = key_compare(), const allocator_type& alloc = allocator_type())
        : root_(nullptr), comp_(comp), node_alloc_(alloc), size_(0), rotation_count_(0) {}

    AVLOrderStatMap(std::initializer_list<value_type> init,
                    const key_compare& comp = key_compare(), const allocator_type& alloc = allocator_type())
        : AVLOrderStatMap(comp, alloc)
    {
        for (const auto& v : init) insert(v);
    }

    AVLOrderStatMap(const AVLOrderStatMap& other)
        : root_(nullptr), comp_(other.comp_),
          node_alloc_(NodeAllocTraits::select_on_container_copy_construction(other.node_alloc_)),
          size_(0), rotation_count_(0)
    {
        root_ = clone_nodes(other.root_);
        size_ = other.size_;
    }

    AVLOrderStatMap(AVLOrderStatMap&& other) noexcept
        : root_(other.root_), comp_(std::move(other.comp_)), node_alloc_(std::move(other.node_alloc_)),
          size_(other.size_), rotation_count_(other.rotation_count_)
    {
        other.root_ = nullptr;
        other.size_ = 0;
        other.rotation_count_ = 0;
    }

    AVLOrderStatMap& operator=(AVLOrderStatMap&& other) {
        if (this == &other) return *this;

        using POCMA = typename NodeAllocTraits::propagate_on_container_move_assignment;
        bool allocs_equal = NodeAllocTraits::is_always_equal::value || (node_alloc_ == other.node_alloc_);
        clear();
        comp_ = std::move(other.comp_);
        if (POCMA::value || allocs_equal) {
            if constexpr (POCMA::value) node_alloc_ = std::move(other.node_alloc_);
            root_ = other.root_;
            size_ = other.size_;
            rotation_count_ = other.rotation_count_;
            other.root_ = nullptr;
            other.size_ = 0;
            other.rotation_count_ = 0;
        } else {
            // node memory belongs to other's allocator: move the elements into nodes of our own
            move_elements_from(other.root_);
            rotation_count_ = 0;
            other.clear();
            other.rotation_count_ = 0;
        }
        return *this;
    }

    AVLOrderStatMap& operator=(const AVLOrderStatMap& other) {
        if (this != &other) {
            Node* fresh = clone_nodes(other.root_);
            clear();
            comp_ = other.comp_;
            root_ = fresh;
            size_ = other.size_;
            rotation_count_ = 0;
        }
        return *this;
    }

    ~AVLOrderStatMap() {
        clear();
    }

    // capacity
    bool empty() const noexcept { return size_ == 0; }
    size_type size() const noexcept { return size_; }
    size_type max_size() const noexcept { return std::numeric_limits<size_type>::max() / sizeof(Node); }

    // height of the whole tree (0 when empty)
    int height() const noexcept { return height_of(root_); }

    // iterators
    iterator begin() { return iterator(root_); }
    const_iterator begin() const { return const_iterator(root_); }
    const_iterator cbegin() const { return begin(); }

    iterator end() noexcept { return iterator(); }
    const_iterator end() const noexcept { return const_iterator(); }
    const_iterator cend() const noexcept { return end(); }

    // element access
    mapped_type& at(const key_type& k) {
        Node* n = find_node(k);
        if (n == nullptr) throw key_not_found("AVLOrderStatMap::at: key not found");
        return n->value.second;
    }

    const mapped_type& at(const key_type& k) const {
        const Node* n = find_node_const(k);
        if (n == nullptr) throw key_not_found("AVLOrderStatMap::at: key not found");
        return n->value.second;
    }

    // modifiers: insert/emplace throw duplicate_key if the key is already present
    void insert(const value_type& v) {
        root_ = insert_node(root_, v);
    }

    void insert(value_type&& v) {
        root_ = insert_node(root_, std::move(v));
    }

    template <typename M>
    void insert(const key_type& k, M&& m) {
        root_ = insert_node(root_, value_type(k, std::forward<M>(m)));
    }

    template <typename... Args>
    void emplace(Args&&... args) {
        value_type val(std::forward<Args>(args)...);
        root_ = insert_node(root_, std::move(val));
    }

    // Returns true if k was inserted, false if an existing value was overwritten.
    template <typename M>
    bool insert_or_assign(const key_type& k, M&& m) {
        Node* n = find_node(k);
        if (n != nullptr) {
            n->value.second = std::forward<M>(m);
            return false;
        }
        root_ = insert_node(root_, value_type(k, std::forward<M>(m)));
        return true;
    }

    // throws key_not_found if k is absent
    void erase(const key_type& k) {
        root_ = erase_node(root_, k);
    }

    void clear() noexcept {
        clear_nodes(root_);
        root_ = nullptr;
        size_ = 0;
    }

    void swap(AVLOrderStatMap& other) {
        using POCS = typename NodeAllocTraits::propagate_on_container_swap;
        bool allocs_equal = NodeAllocTraits::is_always_equal::value || (node_alloc_ == other.node_alloc_);
        using std::swap;
        if (POCS::value || allocs_equal) {
            swap(root_, other.root_);
            swap(comp_, other.comp_);
            if constexpr (POCS::value) swap(node_alloc_, other.node_alloc_);
            swap(size_, other.size_);
            swap(rotation_count_, other.rotation_count_);
        } else {
            // allocators not equal and not allowed to propagate: swap by moving elements individually
            AVLOrderStatMap tmp(comp_, allocator_type(node_alloc_));
            tmp = std::move(*this);
            *this = std::move(other);
            other = std::move(tmp);
        }
    }

    // lookup
    bool contains(const key_type& k) const {
        return find_node_const(k) != nullptr;
    }

    size_type count(const key_type& k) const {
        return contains(k) ? 1 : 0;
    }

    // order statistics: k = 1 is the largest key. Requires 1 <= k <= size().
    const value_type& kth_largest(size_type k) const {
        return select_from_right(k)->value;
    }

    value_type& kth_largest(size_type k) {
        return const_cast<Node*>(select_from_right(k))->value;
    }

    // k = 1 is the smallest key. Requires 1 <= k <= size().
    const value_type& kth_smallest(size_type k) const {
        if (k < 1 || k > size_) throw rank_out_of_range("AVLOrderStatMap::kth_smallest: rank out of range");
        return select_from_right(size_ - k + 1)->value;
    }

    key_compare key_comp() const { return comp_; }

    allocator_type get_allocator() const { return allocator_type(node_alloc_); }

    // Instrumentation accessors
    size_t rotation_count() const noexcept { return rotation_count_; }
    void reset_rotation_count() noexcept { rotation_count_ = 0; }

    // validate_invariants_json:
    // Produces structured JSON diagnostics in out_json.
    // Returns true if invariants hold, false otherwise.
    //
    // JSON structure:
    // {
    //   "valid": true|false,
    //   "size_reported": n,
    //   "size_actual": n2,
    //   "height": h,
    //   "rotation_count": r,
    //   "issues": [ "..." , ... ],
    //   "nodes": [
    //       { "key": "...", "height": h, "count": c, "balance": b, "left": "..."|null, "right": "..."|null, "addr": "0x..." },
    //       ...
    //   ]
    // }
    bool validate_invariants_json(std::string& out_json) const {
        std::vector<std::string> issues;
        bool valid = true;

        struct Measure {
            bool ok;
            int height;
            size_type count;
        };

        // recomputes height/count from scratch and compares with the cached fields
        std::function<Measure(const Node*, const Key*, const Key*)> validate_node;
        validate_node = [&](const Node* node, const Key* min_key, const Key* max_key) -> Measure {
            if (node == nullptr) return { true, 0, 0 };

            if (min_key && !comp_(*min_key, node->value.first)) {
                std::ostringstream oss;
                oss << "BST violation: node " << key_to_string(node->value.first)
                    << " not greater than lower bound " << key_to_string(*min_key);
                issues.push_back(oss.str());
                return { false, 0, 0 };
            }
            if (max_key && !comp_(node->value.first, *max_key)) {
                std::ostringstream oss;
                oss << "BST violation: node " << key_to_string(node->value.first)
                    << " not less than upper bound " << key_to_string(*max_key);
                issues.push_back(oss.str());
                return { false, 0, 0 };
            }

            Measure left = validate_node(node->left, min_key, &node->value.first);
            if (!left.ok) return { false, 0, 0 };
            Measure right = validate_node(node->right, &node->value.first, max_key);
            if (!right.ok) return { false, 0, 0 };

            int h = 1 + std::max(left.height, right.height);
            size_type c = 1 + left.count + right.count;
            if (node->height != h) {
                std::ostringstream oss;
                oss << "Height mismatch at key " << key_to_string(node->value.first)
                    << " cached=" << node->height << " actual=" << h;
                issues.push_back(oss.str());
                return { false, 0, 0 };
            }
            if (node->count != c) {
                std::ostringstream oss;
                oss << "Count mismatch at key " << key_to_string(node->value.first)
                    << " cached=" << node->count << " actual=" << c;
                issues.push_back(oss.str());
                return { false, 0, 0 };
            }
            if (std::abs(right.height - left.height) > 1) {
                std::ostringstream oss;
                oss << "Balance violation at key " << key_to_string(node->value.first)
                    << " left_h=" << left.height << " right_h=" << right.height;
                issues.push_back(oss.str());
                return { false, 0, 0 };
            }
            return { true, h, c };
        };

        Measure whole = validate_node(root_, nullptr, nullptr);
        if (!whole.ok) valid = false;

        // verify size_ matches actual count
        size_t counted = 0;
        std::function<void(const Node*)> count_fn = [&](const Node* n) {
            if (n == nullptr) return;
            ++counted;
            count_fn(n->left);
            count_fn(n->right);
        };
        count_fn(root_);
        if (counted != size_) {
            std::ostringstream oss;
            oss << "Size mismatch: size_=" << size_ << " actual=" << counted;
            issues.push_back(oss.str());
            valid = false;
        }

        // Build node list (BFS for deterministic ordering)
        std::vector<std::string> node_jsons;
        if (root_ != nullptr) {
            std::queue<const Node*> q;
            q.push(root_);
            while (!q.empty()) {
                const Node* n = q.front(); q.pop();
                std::ostringstream nj;
                nj << "{";
                nj << "\"key\":" << json_escape_and_quote(key_to_string(n->value.first)) << ",";
                nj << "\"height\":" << n->height << ",";
                nj << "\"count\":" << n->count << ",";
                nj << "\"balance\":" << balance_of(n) << ",";
                if (n->left) nj << "\"left\":" << json_escape_and_quote(key_to_string(n->left->value.first)) << ",";
                else nj << "\"left\":null,";
                if (n->right) nj << "\"right\":" << json_escape_and_quote(key_to_string(n->right->value.first)) << ",";
                else nj << "\"right\":null,";
                nj << "\"addr\":\"" << pointer_to_hex(n) << "\"";
                nj << "}";
                node_jsons.push_back(nj.str());
                if (n->left) q.push(n->left);
                if (n->right) q.push(n->right);
            }
        }

        // Compose final JSON
        std::ostringstream out;
        out << "{";
        out << "\"valid\":" << (valid ? "true" : "false") << ",";
        out << "\"size_reported\":" << size_ << ",";
        out << "\"size_actual\":" << counted << ",";
        out << "\"height\":" << height_of(root_) << ",";
        out << "\"rotation_count\":" << rotation_count_ << ",";
        out << "\"issues\":[";
        for (size_t i = 0; i < issues.size(); ++i) {
            out << json_escape_and_quote(issues[i]);
            if (i + 1 < issues.size()) out << ",";
        }
        out << "],";
        out << "\"nodes\":[";
        for (size_t i = 0; i < node_jsons.size(); ++i) {
            out << node_jsons[i];
            if (i + 1 < node_jsons.size()) out << ",";
        }
        out << "]";
        out << "}";
        out_json = out.str();
        return valid && issues.empty();
    }

    // If out is non-null, it receives the JSON diagnostics followed by a tree dump.
    bool validate_invariants(std::string* out = nullptr) const {
        std::string json;
        bool ok = validate_invariants_json(json);
        if (!out) return ok;
        std::ostringstream oss;
        oss << "validate_invariants: valid=" << (ok ? "true" : "false") << "\n";
        oss << "JSON diagnostics:\n" << json << "\n";
        oss << "Tree dump:\n";
        oss << tree_dump_to_string(false) << "\n";
        *out = oss.str();
        return ok;
    }

    // Pretty-print tree with indentation. Set show_addresses = true to include node pointer addresses for debugging.
    void tree_dump(std::ostream& os, bool show_addresses = false) const {
        os << tree_dump_to_string(show_addresses);
    }

    std::string tree_dump_to_string(bool show_addresses = false) const {
        std::ostringstream oss;
        if (root_ == nullptr) {
            oss << "<empty tree>\n";
            return oss.str();
        }
        std::function<void(const Node*, std::string)> print_node = [&](const Node* n, std::string indent) {
            if (n == nullptr) {
                oss << indent << "(null)\n";
                return;
            }
            oss << indent << key_to_string(n->value.first);
            oss << "  h=" << n->height << " n=" << n->count << " bf=" << balance_of(n);
            if (show_addresses) oss << " @" << pointer_to_hex(n);
            oss << "\n";
            if (n->left == nullptr && n->right == nullptr) return;
            print_node(n->left, indent + "  L-");
            print_node(n->right, indent + "  R-");
        };
        print_node(root_, "");
        return oss.str();
    }

private:
    Node* root_;
    key_compare comp_;
    NodeAlloc node_alloc_;
    size_type size_;
    size_t rotation_count_;

    // cached-field accessors; an absent child has height 0 and count 0
    static int height_of(const Node* n) noexcept { return n ? n->height : 0; }
    static size_type count_of(const Node* n) noexcept { return n ? n->count : 0; }
    static int balance_of(const Node* n) noexcept { return n ? height_of(n->right) - height_of(n->left) : 0; }

    static void refresh(Node* n) noexcept {
        n->height = 1 + std::max(height_of(n->left), height_of(n->right));
        n->count = 1 + count_of(n->left) + count_of(n->right);
    }

    // iterator helpers
    template <typename P>
    static void push_left(std::vector<P>& stack, typename std::vector<P>::value_type n) {
        while (n != nullptr) {
            stack.push_back(n);
            n = n->left;
        }
    }

    template <typename P>
    static void step_forward(std::vector<P>& stack) {
        P n = stack.back();
        stack.pop_back();
        push_left(stack, n->right);
    }

    // x's right child y becomes the subtree root; y's left subtree moves under x
    Node* left_rotate(Node* x) noexcept {
        Node* y = x->right;
        x->right = y->left;
        y->left = x;
        refresh(x);
        refresh(y);
        ++rotation_count_;
        return y;
    }

    // mirror of left_rotate
    Node* right_rotate(Node* y) noexcept {
        Node* x = y->left;
        y->left = x->right;
        x->right = y;
        refresh(y);
        refresh(x);
        ++rotation_count_;
        return x;
    }

    // n's cached fields must already be current. Returns the new subtree root.
    Node* rebalance(Node* n) noexcept {
        int balance = balance_of(n);
        if (balance >= 2) {
            if (height_of(n->right->left) > height_of(n->right->right))
                n->right = right_rotate(n->right);
            return left_rotate(n);
        }
        if (balance <= -2) {
            if (height_of(n->left->right) > height_of(n->left->left))
                n->left = left_rotate(n->left);
            return right_rotate(n);
        }
        return n;
    }

    // The new leaf is allocated only once the descent reached an empty link, so a duplicate key
    // (or a throwing allocation) unwinds before any ancestor link is rewritten.
    template <typename V>
    Node* insert_node(Node* n, V&& v) {
        if (n == nullptr) {
            Node* leaf = allocate_node(std::forward<V>(v));
            ++size_;
            return leaf;
        }
        if (comp_(v.first, n->value.first)) n->left = insert_node(n->left, std::forward<V>(v));
        else if (comp_(n->value.first, v.first)) n->right = insert_node(n->right, std::forward<V>(v));
        else throw duplicate_key("AVLOrderStatMap::insert: duplicate key");
        refresh(n);
        return rebalance(n);
    }

    Node* erase_node(Node* n, const key_type& k) {
        if (n == nullptr) throw key_not_found("AVLOrderStatMap::erase: key not found");
        if (comp_(k, n->value.first)) {
            n->left = erase_node(n->left, k);
        } else if (comp_(n->value.first, k)) {
            n->right = erase_node(n->right, k);
        } else {
            Node* replacement;
            if (n->left == nullptr) {
                replacement = n->right;
            } else if (n->right == nullptr) {
                replacement = n->left;
            } else {
                // two children: the in-order successor takes n's place
                Node* successor = nullptr;
                Node* rest = detach_min(n->right, successor);
                successor->left = n->left;
                successor->right = rest;
                refresh(successor);
                replacement = rebalance(successor);
            }
            deallocate_node(n);
            --size_;
            return replacement;
        }
        refresh(n);
        return rebalance(n);
    }

    // Unlinks the leftmost node of subtree n into min_out and returns the rebalanced remainder.
    Node* detach_min(Node* n, Node*& min_out) noexcept {
        if (n->left == nullptr) {
            min_out = n;
            Node* rest = n->right;
            n->right = nullptr;
            return rest;
        }
        n->left = detach_min(n->left, min_out);
        refresh(n);
        return rebalance(n);
    }

    // at each node let r = count(right): k == r + 1 is this node, k <= r goes right,
    // otherwise go left with k - r - 1
    const Node* select_from_right(size_type k) const {
        if (k < 1 || k > size_) throw rank_out_of_range("AVLOrderStatMap::kth_largest: rank out of range");
        const Node* n = root_;
        for (;;) {
            size_type r = count_of(n->right);
            if (k == r + 1) return n;
            if (k <= r) {
                n = n->right;
            } else {
                k -= r + 1;
                n = n->left;
            }
        }
    }

    // find helpers
    Node* find_node(const key_type& key) {
        Node* x = root_;
        while (x != nullptr) {
            if (comp_(key, x->value.first)) x = x->left;
            else if (comp_(x->value.first, key)) x = x->right;
            else return x;
        }
        return nullptr;
    }

    const Node* find_node_const(const key_type& key) const {
        const Node* x = root_;
        while (x != nullptr) {
            if (comp_(key, x->value.first)) x = x->left;
            else if (comp_(x->value.first, key)) x = x->right;
            else return x;
        }
        return nullptr;
    }

    // node allocation helpers
    template <typename... Args>
    Node* allocate_node(Args&&... args) {
        Node* n = NodeAllocTraits::allocate(node_alloc_, 1);
        try {
            NodeAllocTraits::construct(node_alloc_, n, std::forward<Args>(args)...);
        } catch (...) {
            NodeAllocTraits::deallocate(node_alloc_, n, 1);
            throw;
        }
        return n;
    }

    void deallocate_node(Node* n) noexcept {
        NodeAllocTraits::destroy(node_alloc_, n);
        NodeAllocTraits::deallocate(node_alloc_, n, 1);
    }

    // Structural copy; cached fields are copied rather than recomputed.
    Node* clone_nodes(const Node* src) {
        if (src == nullptr) return nullptr;
        Node* n = allocate_node(src->value);
        try {
            n->left = clone_nodes(src->left);
            n->right = clone_nodes(src->right);
        } catch (...) {
            clear_nodes(n);
            throw;
        }
        n->height = src->height;
        n->count = src->count;
        return n;
    }

    // preorder, so each parent lands before its children
    void move_elements_from(Node* src) {
        if (src == nullptr) return;
        root_ = insert_node(root_, std::move(src->value));
        move_elements_from(src->left);
        move_elements_from(src->right);
    }

    // clear helper (postorder)
    void clear_nodes(Node* node) noexcept {
        if (node == nullptr) return;
        clear_nodes(node->left);
        clear_nodes(node->right);
        deallocate_node(node);
    }

    // utility: convert pointer to hex string
    static std::string pointer_to_hex(const void* p) {
        std::ostringstream oss;
        oss << "0x" << std::hex << reinterpret_cast<uintptr_t>(p) << std::dec;
        return oss.str();
    }

    // utility: escape string for JSON and wrap in quotes
    static std::string json_escape_and_quote(const std::string& s) {
        std::ostringstream o;
        o << "\"";
        for (char c : s) {
            switch (c) {
                case '\"': o << "\\\""; break;
                case '\\': o << "\\\\"; break;
                case '\b': o << "\\b"; break;
                case '\f': o << "\\f"; break;
                case '\n': o << "\\n"; break;
                case '\r': o << "\\r"; break;
                case '\t': o << "\\t"; break;
                default:
                    if (static_cast<unsigned char>(c) < 0x20) {
                        o << "\\u" << std::hex << std::setw(4) << std::setfill('0')
                          << static_cast<unsigned>(static_cast<unsigned char>(c)) << std::dec << std::setfill(' ');
                    } else {
                        o << c;
                    }
            }
        }
        o << "\"";
        return o.str();
    }

    // helper: stream Key into string (requires operator<<)
    template <typename K = Key>
    static std::string key_to_string(const K& k) {
        std::ostringstream oss;
        oss << k;
        return oss.str();
    }
};

template <typename Key, typename T, typename Compare, typename Alloc>
void swap(AVLOrderStatMap<Key, T, Compare, Alloc>& a, AVLOrderStatMap<Key, T, Compare, Alloc>& b) {
    a.swap(b);
}

#endif // OSTREE_AVL_ORDER_STAT_MAP_HPP
