#pragma once

#include "retable/parser/ast.hpp"

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace retable::parser::relational {

class AstArena {
public:
    AstArena() = default;
    AstArena(const AstArena&) = delete;
    AstArena& operator=(const AstArena&) = delete;
    AstArena(AstArena&&) noexcept = default;
    AstArena& operator=(AstArena&&) noexcept = default;
    ~AstArena() noexcept;

    template <typename T, typename... Args>
    T& make(Args&&... args)
    {
        void* storage = allocate(sizeof(T), alignof(T));
        auto* object = std::construct_at(static_cast<T*>(storage), std::forward<Args>(args)...);
        register_destructor(object);
        return *object;
    }

    void reset() noexcept;

private:
    struct Chunk final {
        std::unique_ptr<std::byte[]> data{};
        std::size_t capacity = 0U;
        std::size_t used = 0U;
    };

    struct Destructor final {
        void (*destroy)(void*) noexcept = nullptr;
        void* pointer = nullptr;
    };

    static constexpr std::size_t kDefaultChunkSize = 4096U;

    static std::size_t align_up(std::size_t value, std::size_t alignment) noexcept;
    void* allocate(std::size_t size, std::size_t alignment);
    void add_chunk(std::size_t minimum_capacity);

    template <typename T>
    void register_destructor(T* pointer)
    {
        Destructor entry{};
        entry.pointer = pointer;
        entry.destroy = [](void* storage) noexcept {
            std::destroy_at(static_cast<T*>(storage));
        };
        destructors_.push_back(entry);
    }

    std::vector<Chunk> chunks_{};
    std::vector<Destructor> destructors_{};
};

enum class NodeKind : std::uint8_t {
    SelectStatement = 0,
    WithClause,
    CommonTableExpression,
    QuerySpecification,
    SetOperation,
    SelectItem,
    TableReference,
    DerivedTable,
    JoinedTable,
    IdentifierExpression,
    LiteralExpression,
    UnaryExpression,
    BinaryExpression,
    StarExpression,
    FunctionCall,
    InExpression,
    BetweenExpression,
    IsNullExpression,
    ExistsExpression,
    SubqueryExpression,
    CaseExpression,
    CastExpression,
    ParenthesizedExpression,
    OrderByItem,
    LimitClause,
    TableFunction,
    InlineTable,
    NestedJoin,
    WindowSpecification
};

enum class LiteralTag : std::uint8_t {
    Null = 0,
    Boolean,
    Integer,
    Decimal,
    String
};

enum class UnaryOperator : std::uint8_t {
    Not = 0,
    Negate,
    Plus
};

enum class BinaryOperator : std::uint8_t {
    Equal = 0,
    NotEqual,
    Less,
    LessOrEqual,
    Greater,
    GreaterOrEqual,
    NullSafeEqual,
    Add,
    Subtract,
    Multiply,
    Divide,
    Modulo,
    Concat,
    And,
    Or,
    Like,
    NotLike
};

enum class JoinType : std::uint8_t {
    Inner = 0,
    LeftOuter,
    RightOuter,
    FullOuter,
    Cross,
    LeftSemi,
    LeftAnti
};

enum class SetOperator : std::uint8_t {
    Union = 0,
    Intersect,
    Except
};

struct Node {
    explicit Node(NodeKind kind) noexcept : kind(kind) {}
    Node(const Node&) = delete;
    Node& operator=(const Node&) = delete;
    Node(Node&&) = delete;
    Node& operator=(Node&&) = delete;
    virtual ~Node() = default;

    NodeKind kind;
};

struct SelectStatement;
struct IdentifierExpression;
struct LiteralExpression;
struct UnaryExpression;
struct BinaryExpression;
struct StarExpression;
struct FunctionCall;
struct InExpression;
struct BetweenExpression;
struct IsNullExpression;
struct ExistsExpression;
struct SubqueryExpression;
struct CaseExpression;
struct CastExpression;
struct ParenthesizedExpression;

class ExpressionVisitor {
public:
    virtual ~ExpressionVisitor() = default;
    virtual void visit(const IdentifierExpression& expression) = 0;
    virtual void visit(const LiteralExpression& expression) = 0;
    virtual void visit(const UnaryExpression& expression) = 0;
    virtual void visit(const BinaryExpression& expression) = 0;
    virtual void visit(const StarExpression& expression) = 0;
    virtual void visit(const FunctionCall& expression) = 0;
    virtual void visit(const InExpression& expression) = 0;
    virtual void visit(const BetweenExpression& expression) = 0;
    virtual void visit(const IsNullExpression& expression) = 0;
    virtual void visit(const ExistsExpression& expression) = 0;
    virtual void visit(const SubqueryExpression& expression) = 0;
    virtual void visit(const CaseExpression& expression) = 0;
    virtual void visit(const CastExpression& expression) = 0;
    virtual void visit(const ParenthesizedExpression& expression) = 0;
};

struct Expression : Node {
    explicit Expression(NodeKind kind) noexcept : Node(kind) {}
    ~Expression() override = default;

    void accept(ExpressionVisitor& visitor) const;
};

struct SelectItem : Node {
    SelectItem() noexcept : Node(NodeKind::SelectItem) {}

    Expression* expression = nullptr;
    std::optional<Identifier> alias{};
};

// Base for everything that may appear in a FROM list.
struct TableSource : Node {
    explicit TableSource(NodeKind kind) noexcept : Node(kind) {}
    ~TableSource() override = default;
};

// One occurrence of a named table. The three components are independently
// optional; the parser always fills `name` and fills `catalog` only together
// with `database`.
struct TableReference : TableSource {
    TableReference() noexcept : TableSource(NodeKind::TableReference) {}

    std::optional<Identifier> catalog{};
    std::optional<Identifier> database{};
    std::optional<Identifier> name{};
    std::optional<Identifier> alias{};
};

struct DerivedTable : TableSource {
    DerivedTable() noexcept : TableSource(NodeKind::DerivedTable) {}

    SelectStatement* query = nullptr;
    std::optional<Identifier> alias{};
    std::vector<Identifier> column_aliases{};
};

// `range(10) AS r (id)`; the function name is not a table name.
struct TableFunction : TableSource {
    TableFunction() noexcept : TableSource(NodeKind::TableFunction) {}

    Identifier name{};
    std::vector<Expression*> arguments{};
    std::optional<Identifier> alias{};
    std::vector<Identifier> column_aliases{};
};

// `VALUES (1, 'a'), (2, 'b') AS t (id, label)`, optionally parenthesised.
struct InlineTable : TableSource {
    InlineTable() noexcept : TableSource(NodeKind::InlineTable) {}

    std::vector<std::vector<Expression*>> rows{};
    bool parenthesized = false;
    std::optional<Identifier> alias{};
    std::vector<Identifier> column_aliases{};
};

// A join tree written inside parentheses.
struct NestedJoin : TableSource {
    NestedJoin() noexcept : TableSource(NodeKind::NestedJoin) {}

    TableSource* inner = nullptr;
};

struct JoinedTable : TableSource {
    JoinedTable() noexcept : TableSource(NodeKind::JoinedTable) {}

    JoinType type = JoinType::Inner;
    TableSource* left = nullptr;
    TableSource* right = nullptr;
    Expression* condition = nullptr;
    std::vector<Identifier> using_columns{};
};

struct OrderByItem : Node {
    enum class Direction : std::uint8_t {
        Unspecified = 0,
        Ascending,
        Descending
    };

    OrderByItem() noexcept : Node(NodeKind::OrderByItem) {}

    Expression* expression = nullptr;
    Direction direction = Direction::Unspecified;
};

struct LimitClause : Node {
    LimitClause() noexcept : Node(NodeKind::LimitClause) {}

    Expression* row_count = nullptr;
    Expression* offset = nullptr;
};

struct WindowFrameBound final {
    enum class Kind : std::uint8_t {
        UnboundedPreceding = 0,
        Preceding,
        CurrentRow,
        Following,
        UnboundedFollowing
    };

    Kind kind = Kind::CurrentRow;
    // Set for Preceding and Following only.
    Expression* offset = nullptr;
};

struct WindowFrame final {
    enum class Unit : std::uint8_t {
        Rows = 0,
        Range
    };

    Unit unit = Unit::Rows;
    WindowFrameBound start{};
    // Present for the BETWEEN form.
    std::optional<WindowFrameBound> end{};
};

struct WindowSpecification : Node {
    WindowSpecification() noexcept : Node(NodeKind::WindowSpecification) {}

    std::vector<Expression*> partition_by{};
    std::vector<OrderByItem*> order_by{};
    std::optional<WindowFrame> frame{};
};

// Either a QuerySpecification or a SetOperation.
struct QueryExpression : Node {
    explicit QueryExpression(NodeKind kind) noexcept : Node(kind) {}
    ~QueryExpression() override = default;
};

struct QuerySpecification : QueryExpression {
    QuerySpecification() noexcept : QueryExpression(NodeKind::QuerySpecification) {}

    bool distinct = false;
    std::vector<SelectItem*> select_items{};
    std::vector<TableSource*> from{};
    Expression* where = nullptr;
    std::vector<Expression*> group_by{};
    Expression* having = nullptr;
    std::vector<OrderByItem*> order_by{};
    LimitClause* limit = nullptr;
};

struct SetOperation : QueryExpression {
    SetOperation() noexcept : QueryExpression(NodeKind::SetOperation) {}

    SetOperator op = SetOperator::Union;
    bool all = false;
    QueryExpression* left = nullptr;
    QueryExpression* right = nullptr;
};

struct CommonTableExpression : Node {
    CommonTableExpression() noexcept : Node(NodeKind::CommonTableExpression) {}

    Identifier name{};
    std::vector<Identifier> column_names{};
    SelectStatement* query = nullptr;
};

struct WithClause : Node {
    WithClause() noexcept : Node(NodeKind::WithClause) {}

    bool recursive = false;
    std::vector<CommonTableExpression*> expressions{};
};

struct SelectStatement : Node {
    SelectStatement() noexcept : Node(NodeKind::SelectStatement) {}

    WithClause* with = nullptr;
    QueryExpression* body = nullptr;
};

struct IdentifierExpression : Expression {
    IdentifierExpression() noexcept : Expression(NodeKind::IdentifierExpression) {}

    QualifiedName name{};
};

struct LiteralExpression : Expression {
    LiteralExpression() noexcept : Expression(NodeKind::LiteralExpression) {}

    LiteralTag tag = LiteralTag::String;
    bool boolean_value = false;
    std::string text{};
};

struct UnaryExpression : Expression {
    UnaryExpression() noexcept : Expression(NodeKind::UnaryExpression) {}

    UnaryOperator op = UnaryOperator::Not;
    Expression* operand = nullptr;
};

struct BinaryExpression : Expression {
    BinaryExpression() noexcept : Expression(NodeKind::BinaryExpression) {}

    BinaryOperator op = BinaryOperator::Equal;
    Expression* left = nullptr;
    Expression* right = nullptr;
};

struct StarExpression : Expression {
    StarExpression() noexcept : Expression(NodeKind::StarExpression) {}

    QualifiedName qualifier{};
};

struct FunctionCall : Expression {
    FunctionCall() noexcept : Expression(NodeKind::FunctionCall) {}

    Identifier name{};
    bool distinct = false;
    bool star_argument = false;
    std::vector<Expression*> arguments{};
    // Set when the call carries an OVER clause.
    WindowSpecification* window = nullptr;
};

struct InExpression : Expression {
    InExpression() noexcept : Expression(NodeKind::InExpression) {}

    Expression* operand = nullptr;
    std::vector<Expression*> values{};
    SelectStatement* subquery = nullptr;
    bool negated = false;
};

struct BetweenExpression : Expression {
    BetweenExpression() noexcept : Expression(NodeKind::BetweenExpression) {}

    Expression* operand = nullptr;
    Expression* lower = nullptr;
    Expression* upper = nullptr;
    bool negated = false;
};

struct IsNullExpression : Expression {
    IsNullExpression() noexcept : Expression(NodeKind::IsNullExpression) {}

    Expression* operand = nullptr;
    bool negated = false;
};

struct ExistsExpression : Expression {
    ExistsExpression() noexcept : Expression(NodeKind::ExistsExpression) {}

    SelectStatement* query = nullptr;
};

struct SubqueryExpression : Expression {
    SubqueryExpression() noexcept : Expression(NodeKind::SubqueryExpression) {}

    SelectStatement* query = nullptr;
};

struct CaseExpression : Expression {
    struct WhenClause final {
        Expression* condition = nullptr;
        Expression* result = nullptr;
    };

    CaseExpression() noexcept : Expression(NodeKind::CaseExpression) {}

    Expression* operand = nullptr;
    std::vector<WhenClause> branches{};
    Expression* else_result = nullptr;
};

struct CastExpression : Expression {
    CastExpression() noexcept : Expression(NodeKind::CastExpression) {}

    Expression* operand = nullptr;
    // Type text as written, e.g. `DECIMAL(10, 2)` or `ARRAY<STRUCT<id: INT>>`.
    std::string type_name{};
    bool try_cast = false;
};

struct ParenthesizedExpression : Expression {
    ParenthesizedExpression() noexcept : Expression(NodeKind::ParenthesizedExpression) {}

    Expression* inner = nullptr;
};

[[nodiscard]] std::string format_table_name(const TableReference& table);
[[nodiscard]] std::string_view node_kind_to_string(NodeKind kind) noexcept;

}  // namespace retable::parser::relational

namespace retable::parser::relational {

inline AstArena::~AstArena() noexcept
{
    reset();
}

inline std::size_t AstArena::align_up(std::size_t value, std::size_t alignment) noexcept
{
    const auto mask = alignment - 1U;
    return (value + mask) & ~mask;
}

inline void AstArena::reset() noexcept
{
    for (auto it = destructors_.rbegin(); it != destructors_.rend(); ++it) {
        if (it->destroy && it->pointer) {
            it->destroy(it->pointer);
        }
    }
    destructors_.clear();
    for (auto& chunk : chunks_) {
        chunk.used = 0U;
    }
}

inline void* AstArena::allocate(std::size_t size, std::size_t alignment)
{
    if (alignment == 0U) {
        alignment = alignof(std::max_align_t);
    }

    const auto adjusted_size = align_up(size, alignment);

    while (chunks_.empty() || chunks_.back().used + adjusted_size > chunks_.back().capacity) {
        add_chunk(std::max(kDefaultChunkSize, adjusted_size));
    }

    auto& chunk = chunks_.back();
    const auto offset = align_up(chunk.used, alignment);
    chunk.used = offset + adjusted_size;
    return chunk.data.get() + offset;
}

inline void AstArena::add_chunk(std::size_t minimum_capacity)
{
    Chunk chunk{};
    chunk.capacity = align_up(minimum_capacity, alignof(std::max_align_t));
    chunk.data = std::unique_ptr<std::byte[]>(new std::byte[chunk.capacity]);
    chunk.used = 0U;
    chunks_.push_back(std::move(chunk));
}

inline void Expression::accept(ExpressionVisitor& visitor) const
{
    switch (kind) {
    case NodeKind::IdentifierExpression:
        visitor.visit(static_cast<const IdentifierExpression&>(*this));
        break;
    case NodeKind::LiteralExpression:
        visitor.visit(static_cast<const LiteralExpression&>(*this));
        break;
    case NodeKind::UnaryExpression:
        visitor.visit(static_cast<const UnaryExpression&>(*this));
        break;
    case NodeKind::BinaryExpression:
        visitor.visit(static_cast<const BinaryExpression&>(*this));
        break;
    case NodeKind::StarExpression:
        visitor.visit(static_cast<const StarExpression&>(*this));
        break;
    case NodeKind::FunctionCall:
        visitor.visit(static_cast<const FunctionCall&>(*this));
        break;
    case NodeKind::InExpression:
        visitor.visit(static_cast<const InExpression&>(*this));
        break;
    case NodeKind::BetweenExpression:
        visitor.visit(static_cast<const BetweenExpression&>(*this));
        break;
    case NodeKind::IsNullExpression:
        visitor.visit(static_cast<const IsNullExpression&>(*this));
        break;
    case NodeKind::ExistsExpression:
        visitor.visit(static_cast<const ExistsExpression&>(*this));
        break;
    case NodeKind::SubqueryExpression:
        visitor.visit(static_cast<const SubqueryExpression&>(*this));
        break;
    case NodeKind::CaseExpression:
        visitor.visit(static_cast<const CaseExpression&>(*this));
        break;
    case NodeKind::CastExpression:
        visitor.visit(static_cast<const CastExpression&>(*this));
        break;
    case NodeKind::ParenthesizedExpression:
        visitor.visit(static_cast<const ParenthesizedExpression&>(*this));
        break;
    default:
        break;
    }
}

}  // namespace retable::parser::relational
