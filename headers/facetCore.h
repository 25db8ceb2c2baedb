/*
 * facetCore
 *
 *  Type relations, operability contracts, contextual chains and
 *  null-object defaults for external capability sets.
 */

#ifndef FACET_H_
#define FACET_H_

#include <map>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <type_traits>
#include <utility>
#include <vector>

namespace facet
{
    // Forward declarations
    class TypeSpace;
    class TypeDescriptor;
    class AbsentType;
    class DocumentNode;
    class ReflectiveType;
    class TypeVisitor;
    class Element;
    class JsonElement;
    class XmlElement;
    class NullType;
    class NullNode;
    class NullElement;
    class Fraction;

    #define FACET_DEFAULT_HIERARCHY_DEPTH 64
    #define FACET_ABSENT_TYPE (&facet::AbsentType::instance())

    //================================================================================
    // Errors
    //================================================================================

    //! Canonical message texts shared by every module.
    namespace Message
    {
        extern const char* const ChainSuperseded;
        extern const char* const ChainTerminated;
        extern const char* const DivisionByZero;
        extern const char* const NullOperand;
        extern const char* const OperationImpossible;
        extern const char* const StandardObjectInoperable;
        extern const char* const TypeAbsentParent;
        extern const char* const TypeExists;
        extern const char* const TypeForeign;
        extern const char* const TypeTooDeep;
        extern const char* const ZeroDenominator;
        extern const char* const ZeroNumerator;

        /** Returns \a msg terminated by ": ", or an empty string if \a msg is empty. */
        std::string colon(const std::string& msg);
    }

    /** An operation was attempted that would change a value declared fixed. */
    class InvariantViolation : public std::logic_error
    {
    public:
        explicit InvariantViolation(const std::string& what) : std::logic_error(what) {}
    };

    /** A required operand was absent. Checked before any invariant. */
    class MissingArgument : public std::invalid_argument
    {
    public:
        explicit MissingArgument(const std::string& what) : std::invalid_argument(what) {}
    };

    class ArithmeticError : public std::runtime_error
    {
    public:
        explicit ArithmeticError(const std::string& what) : std::runtime_error(what) {}
    };

    /** A chain link was used after the chain was terminated, superseded or failed. */
    class ChainTerminated : public std::logic_error
    {
    public:
        explicit ChainTerminated(const std::string& what) : std::logic_error(what) {}
    };

    //================================================================================
    // Type Relation
    //================================================================================

    /**
     * @brief An immutable, hierarchy-aware type descriptor.
     *
     * Descriptors are created and owned by a TypeSpace (or are the process wide
     * AbsentType) and are compared by identity. Parents are fixed at declaration,
     * so the hierarchy is acyclic and never changes.
     */
    class TypeDescriptor
    {
    public:
        virtual ~TypeDescriptor();

        TypeDescriptor(const TypeDescriptor&) = delete;
        TypeDescriptor& operator=(const TypeDescriptor&) = delete;

        //- Identity
        const std::string& getName() const;
        unsigned long getHash() const;
        const TypeSpace* getSpace() const;
        virtual bool isAbsent() const;

        //- Hierarchy
        const std::vector<const TypeDescriptor*>& getParents() const;
        unsigned int getDepth() const;

        /**
         * @brief Returns true if \a candidate is this type or one of its declared subtypes.
         * Reflexive and transitive. A null or absent candidate answers false.
         */
        virtual bool is(const TypeDescriptor* candidate) const;

        /** Returns true if this type is \a other or one of its subtypes. */
        bool isSubtypeOf(const TypeDescriptor* other) const;

    protected:
        TypeDescriptor(const TypeSpace* space,
                       std::string name,
                       std::vector<const TypeDescriptor*> parents,
                       unsigned long hash);

    private:
        friend class TypeSpace;

        const TypeSpace* space;
        const std::string name;
        const std::vector<const TypeDescriptor*> parents;
        const unsigned long hash;
        const unsigned int depth;
    };

    /**
     * @brief Owner and registry of type descriptors.
     */
    class TypeSpace
    {
    public:
        explicit TypeSpace();
        ~TypeSpace();

        TypeSpace(const TypeSpace&) = delete;
        TypeSpace& operator=(const TypeSpace&) = delete;

        //- Declaration
        /**
         * @brief Declares a new type below \a parents.
         * @throws std::invalid_argument on a duplicate name, a parent owned by another
         * space, an absent parent, or a hierarchy deeper than maxHierarchyDepth.
         */
        const TypeDescriptor* newType(const std::string& name,
                                      const std::vector<const TypeDescriptor*>& parents = {});

        //- Lookup
        /** Returns the named type, the callback's answer, or the absent type. Never null. */
        const TypeDescriptor* getType(const std::string& name);
        bool isDeclared(const std::string& name) const;
        unsigned long getSize() const;

        //- Configuration
        unsigned int maxHierarchyDepth;
        bool diagnostics;

        //- Callbacks
        const TypeDescriptor* (*typeNotFoundCallback)(
            TypeSpace* space,
            const std::string& name){};

    private:
        struct Impl;
        std::unique_ptr<Impl> impl;
    };

    //================================================================================
    // External capability sets
    //================================================================================

    typedef std::vector<DocumentNode*> NodeList;

    enum NodeType : unsigned short
    {
        NONE_NODE = 0,
        ELEMENT_NODE = 1,
        ATTRIBUTE_NODE = 2,
        TEXT_NODE = 3,
        CDATA_SECTION_NODE = 4,
        ENTITY_REFERENCE_NODE = 5,
        ENTITY_NODE = 6,
        PROCESSING_INSTRUCTION_NODE = 7,
        COMMENT_NODE = 8,
        DOCUMENT_NODE = 9,
        DOCUMENT_TYPE_NODE = 10,
        DOCUMENT_FRAGMENT_NODE = 11,
        NOTATION_NODE = 12
    };

    typedef void (*UserDataHandler)(
        unsigned short operation,
        const std::string& key,
        void* data,
        const DocumentNode* source,
        const DocumentNode* destination);

    //! Hierarchical document node, DOM level 3 shape.
    class DocumentNode
    {
    public:
        virtual ~DocumentNode() = default;

        virtual bool isNull() const { return false; }

        //- Naming
        virtual std::string getNodeName() const = 0;
        virtual std::string getLocalName() const = 0;
        virtual std::string getPrefix() const = 0;
        virtual void setPrefix(const std::string& prefix) = 0;
        virtual std::string getNamespaceURI() const = 0;
        virtual std::string getBaseURI() const = 0;
        virtual std::string lookupNamespaceURI(const std::string& prefix) const = 0;
        virtual std::string lookupPrefix(const std::string& namespaceURI) const = 0;
        virtual bool isDefaultNamespace(const std::string& namespaceURI) const = 0;

        //- Value
        virtual unsigned short getNodeType() const = 0;
        virtual std::string getNodeValue() const = 0;
        virtual void setNodeValue(const std::string& nodeValue) = 0;
        virtual std::string getTextContent() const = 0;
        virtual void setTextContent(const std::string& textContent) = 0;

        //- Navigation
        virtual DocumentNode* getParentNode() const = 0;
        virtual NodeList getChildNodes() const = 0;
        virtual DocumentNode* getFirstChild() const = 0;
        virtual DocumentNode* getLastChild() const = 0;
        virtual DocumentNode* getPreviousSibling() const = 0;
        virtual DocumentNode* getNextSibling() const = 0;
        virtual NodeList getAttributes() const = 0;
        virtual DocumentNode* getOwnerDocument() const = 0;
        virtual bool hasChildNodes() const = 0;
        virtual bool hasAttributes() const = 0;

        //- Tree modifiers
        virtual DocumentNode* insertBefore(DocumentNode* newChild, DocumentNode* refChild) = 0;
        virtual DocumentNode* replaceChild(DocumentNode* newChild, DocumentNode* oldChild) = 0;
        virtual DocumentNode* removeChild(DocumentNode* oldChild) = 0;
        virtual DocumentNode* appendChild(DocumentNode* newChild) = 0;
        virtual DocumentNode* cloneNode(bool deep) const = 0;
        virtual void normalize() = 0;

        //- Comparison
        virtual unsigned short compareDocumentPosition(const DocumentNode* other) const = 0;
        virtual bool isSameNode(const DocumentNode* other) const = 0;
        virtual bool isEqualNode(const DocumentNode* other) const = 0;

        //- Features and user data
        virtual bool isSupported(const std::string& feature, const std::string& version) const = 0;
        virtual void* getFeature(const std::string& feature, const std::string& version) const = 0;
        virtual void* setUserData(const std::string& key, void* data, UserDataHandler handler) = 0;
        virtual void* getUserData(const std::string& key) const = 0;
    };

    enum class TypeKind
    {
        NONE,
        BOOLEAN,
        INTEGRAL,
        FLOATING,
        ARRAY,
        DECLARED,
        NULL_TYPE,
        VOID_TYPE,
        ERROR
    };

    struct Annotation
    {
        std::string type;
        std::map<std::string, std::string> elements;
    };

    //! Visitor over reflective types. Results and parameters are opaque.
    class TypeVisitor
    {
    public:
        virtual ~TypeVisitor() = default;
        virtual void* visit(const ReflectiveType* type, void* parameter) = 0;
        virtual void* visitNull(const ReflectiveType* type, void* parameter) = 0;
    };

    //! Reflective view of a type: kind, annotations and visitor dispatch.
    class ReflectiveType
    {
    public:
        virtual ~ReflectiveType() = default;

        virtual void* accept(TypeVisitor* visitor, void* parameter) const = 0;
        virtual const Annotation* getAnnotation(const std::string& annotationType) const = 0;
        virtual std::vector<const Annotation*> getAnnotationMirrors() const = 0;
        virtual std::vector<const Annotation*> getAnnotationsByType(const std::string& annotationType) const = 0;
        virtual TypeKind getKind() const = 0;
    };

    enum class JsonValueType
    {
        NONE,
        ARRAY,
        DOUBLE,
        FALSE_VALUE,
        INTEGER,
        NULL_VALUE,
        OBJECT,
        SCIENTIFIC,
        STRING,
        TRUE_VALUE
    };

    /**
     * @brief Character-sequence view of an element inside a JSON or XML source.
     * Bounds are offsets in the source text; getEnd() == getStart() + length().
     */
    class Element
    {
    public:
        virtual ~Element() = default;

        virtual bool isNull() const { return false; }

        virtual char charAt(int index) const = 0;
        virtual int length() const = 0;
        virtual std::string subSequence(int start, int end) const = 0;
        virtual int getStart() const = 0;
        virtual int getEnd() const = 0;
        virtual void* object() const = 0;
    };

    class JsonElement : public virtual Element
    {
    public:
        virtual JsonValueType getValueType() const = 0;
    };

    class XmlElement : public virtual Element
    {
    public:
        virtual DocumentNode* getNode() const = 0;
    };

    //================================================================================
    // Null-object defaults
    //================================================================================

    /**
     * @brief Reflective type without significance.
     * Every query answers none and the visitor is never called.
     */
    class NullType : public ReflectiveType
    {
    public:
        static const NullType& instance();

        void* accept(TypeVisitor* visitor, void* parameter) const override;
        const Annotation* getAnnotation(const std::string& annotationType) const override;
        std::vector<const Annotation*> getAnnotationMirrors() const override;
        std::vector<const Annotation*> getAnnotationsByType(const std::string& annotationType) const override;
        TypeKind getKind() const override;

    protected:
        NullType() = default;
    };

    /**
     * @brief Document node that is not there.
     * Queries answer empty values and modifiers do nothing. Stateless, shareable.
     */
    class NullNode : public DocumentNode, public virtual NullType
    {
    public:
        /** Non-const because the DocumentNode modifiers are; they still change nothing. */
        static NullNode& instance();

        /** Returns an intermediary node for \a target. Carries no data: the shared instance. */
        static NullNode& of(const DocumentNode* target);

        bool isNull() const override;

        std::string getNodeName() const override;
        std::string getLocalName() const override;
        std::string getPrefix() const override;
        void setPrefix(const std::string& prefix) override;
        std::string getNamespaceURI() const override;
        std::string getBaseURI() const override;
        std::string lookupNamespaceURI(const std::string& prefix) const override;
        std::string lookupPrefix(const std::string& namespaceURI) const override;
        bool isDefaultNamespace(const std::string& namespaceURI) const override;

        unsigned short getNodeType() const override;
        std::string getNodeValue() const override;
        void setNodeValue(const std::string& nodeValue) override;
        std::string getTextContent() const override;
        void setTextContent(const std::string& textContent) override;

        DocumentNode* getParentNode() const override;
        NodeList getChildNodes() const override;
        DocumentNode* getFirstChild() const override;
        DocumentNode* getLastChild() const override;
        DocumentNode* getPreviousSibling() const override;
        DocumentNode* getNextSibling() const override;
        NodeList getAttributes() const override;
        DocumentNode* getOwnerDocument() const override;
        bool hasChildNodes() const override;
        bool hasAttributes() const override;

        DocumentNode* insertBefore(DocumentNode* newChild, DocumentNode* refChild) override;
        DocumentNode* replaceChild(DocumentNode* newChild, DocumentNode* oldChild) override;
        DocumentNode* removeChild(DocumentNode* oldChild) override;
        DocumentNode* appendChild(DocumentNode* newChild) override;
        DocumentNode* cloneNode(bool deep) const override;
        void normalize() override;

        unsigned short compareDocumentPosition(const DocumentNode* other) const override;
        bool isSameNode(const DocumentNode* other) const override;
        bool isEqualNode(const DocumentNode* other) const override;

        bool isSupported(const std::string& feature, const std::string& version) const override;
        void* getFeature(const std::string& feature, const std::string& version) const override;
        void* setUserData(const std::string& key, void* data, UserDataHandler handler) override;
        void* getUserData(const std::string& key) const override;

    protected:
        NullNode() = default;
    };

    /**
     * @brief JSON and XML element that is not there, also a null reflective type.
     */
    class NullElement : public JsonElement, public XmlElement, public virtual NullType
    {
    public:
        static const NullElement& instance();

        //- Intermediary elements
        static const NullElement& of(const JsonElement* target);
        static const NullElement& of(const XmlElement* target);

        bool isNull() const override;

        char charAt(int index) const override;
        int length() const override;
        std::string subSequence(int start, int end) const override;
        int getStart() const override;
        int getEnd() const override;
        void* object() const override;
        JsonValueType getValueType() const override;
        DocumentNode* getNode() const override;

    protected:
        NullElement() = default;
    };

    /**
     * @brief The distinguished absent type.
     *
     * Is only itself and is never a parent. Doubles as a null node, null element
     * and null reflective type wherever a type must stand in for missing document data.
     */
    class AbsentType final : public TypeDescriptor, public NullNode, public NullElement
    {
    public:
        static const AbsentType& instance();

        static const AbsentType& fromNode(const DocumentNode* node);
        static const AbsentType& fromElement(const JsonElement* element);
        static const AbsentType& fromElement(const XmlElement* element);

        bool isNull() const override;
        bool isAbsent() const override;
        bool is(const TypeDescriptor* candidate) const override;

    private:
        AbsentType();
    };

    /**
     * @brief Typed handle over a descriptor.
     * \c is only accepts handles of \a T or of types derived from it.
     */
    template <typename T>
    class Type
    {
    public:
        explicit Type(const TypeDescriptor* descriptor) : descriptor(descriptor ? descriptor : FACET_ABSENT_TYPE) {}

        template <typename U>
        bool is(const Type<U>& candidate) const
        {
            static_assert(std::is_base_of<T, U>::value, "candidate must be T or a subtype of T");
            return descriptor->is(candidate.getDescriptor());
        }

        const TypeDescriptor* getDescriptor() const { return descriptor; }

    private:
        const TypeDescriptor* descriptor;
    };

    //================================================================================
    // Operability
    //================================================================================

    template <typename T>
    struct OperableTraits
    {
        static T zero() { return T(0); }
        static T one() { return T(1); }
    };

    //- Out-of-line reporting, logs when FACET_OPERABLE_DIAG is set and throws
    [[noreturn]] void reportMissingOperand(const char* operation);
    [[noreturn]] void reportInoperable(const char* operation);
    [[noreturn]] void reportDivisionByZero(const char* operation);

    /**
     * @brief Numeric-like value operable by the four basic operations.
     *
     * The default bodies only accept identity operands (zero for add/subtract, one for
     * multiply/divide), which leaves the value untouched; any other operand throws
     * InvariantViolation. An absent operand throws MissingArgument first.
     * plus/minus/times/by apply the in-place form and return this same object.
     */
    template <typename T>
    class Operable
    {
    public:
        virtual ~Operable() = default;

        virtual const T& getValue() const = 0;

        //- In place
        virtual void add(const std::optional<T>& operand)
        {
            if (requireOperand(operand, "add") != OperableTraits<T>::zero())
                reportInoperable("add");
        }

        virtual void subtract(const std::optional<T>& operand)
        {
            if (requireOperand(operand, "subtract") != OperableTraits<T>::zero())
                reportInoperable("subtract");
        }

        virtual void multiply(const std::optional<T>& operand)
        {
            if (requireOperand(operand, "multiply") != OperableTraits<T>::one())
                reportInoperable("multiply");
        }

        virtual void divide(const std::optional<T>& operand)
        {
            if (requireOperand(operand, "divide") != OperableTraits<T>::one())
                reportInoperable("divide");
        }

        //- Value returning
        Operable& plus(const std::optional<T>& operand) { add(operand); return *this; }
        Operable& minus(const std::optional<T>& operand) { subtract(operand); return *this; }
        Operable& times(const std::optional<T>& operand) { multiply(operand); return *this; }
        Operable& by(const std::optional<T>& operand) { divide(operand); return *this; }

    protected:
        static const T& requireOperand(const std::optional<T>& operand, const char* operation)
        {
            if (!operand)
                reportMissingOperand(operation);
            return *operand;
        }
    };

    //! A value fixed for its lifetime. Only identity operations are accepted.
    template <typename T>
    class LockedValue final : public Operable<T>
    {
    public:
        explicit LockedValue(T value) : value(std::move(value)) {}

        const T& getValue() const override { return value; }

    private:
        const T value;
    };

    //! A value all four operations apply to. Division by zero throws ArithmeticError.
    template <typename T>
    class FreeValue final : public Operable<T>
    {
    public:
        explicit FreeValue(T value) : value(std::move(value)) {}

        const T& getValue() const override { return value; }

        void add(const std::optional<T>& operand) override
        {
            value += Operable<T>::requireOperand(operand, "add");
        }

        void subtract(const std::optional<T>& operand) override
        {
            value -= Operable<T>::requireOperand(operand, "subtract");
        }

        void multiply(const std::optional<T>& operand) override
        {
            value *= Operable<T>::requireOperand(operand, "multiply");
        }

        void divide(const std::optional<T>& operand) override
        {
            const T& divisor = Operable<T>::requireOperand(operand, "divide");
            if (divisor == OperableTraits<T>::zero())
                reportDivisionByZero("divide");
            value /= divisor;
        }

    private:
        T value;
    };

    /**
     * @brief Normalized rational number.
     * The sign is kept on the numerator, numerator and denominator are coprime and
     * zero is 0/1.
     */
    class Fraction
    {
    public:
        /** @throws std::invalid_argument if \a denominator is zero. */
        Fraction(long numerator, long denominator = 1);

        long getNumerator() const { return numerator; }
        long getDenominator() const { return denominator; }

        //- In place
        void add(const Fraction& other);
        void subtract(const Fraction& other);
        void multiply(const Fraction& other);
        /** @throws ArithmeticError if \a other is zero. */
        void divide(const Fraction& other);
        /** @throws ArithmeticError if the numerator is zero. */
        void invert();

        Fraction& operator+=(const Fraction& other) { add(other); return *this; }
        Fraction& operator-=(const Fraction& other) { subtract(other); return *this; }
        Fraction& operator*=(const Fraction& other) { multiply(other); return *this; }
        Fraction& operator/=(const Fraction& other) { divide(other); return *this; }

        //- Comparison
        int compare(const Fraction& other) const;
        bool operator==(const Fraction& other) const;
        bool operator!=(const Fraction& other) const { return !(*this == other); }
        bool operator<(const Fraction& other) const { return compare(other) < 0; }

        //- Conversion
        double doubleValue() const;
        long longValue() const;
        std::string toString() const;
        std::string toStringWithDenominator() const;

    private:
        void simplify();

        long numerator;
        long denominator;
    };

    //================================================================================
    // Contextual chaining
    //================================================================================

    //! Anything usable as a context.
    class Context
    {
    public:
        virtual ~Context() = default;
    };

    #define FACET_CHAIN_OPEN 0
    #define FACET_CHAIN_SUPERSEDED 1
    #define FACET_CHAIN_TERMINATED 2
    #define FACET_CHAIN_FAILED 3

    //- Throws ChainTerminated for a carrier in state \a state
    [[noreturn]] void reportClosedChain(int state);

    /**
     * @brief A context that carries a context of type \a C.
     *
     * Concrete carriers define the chain methods. Each either applies its meaning to the
     * carried context and returns the same carrier, or returns a brand new carrier. The
     * chain ends with one subject call that reads the accumulated context. A carrier
     * belongs to exactly one chain: it can be moved, never copied.
     */
    template <typename C>
    class Contextual : public Context
    {
    public:
        typedef C ContextType;

        Contextual() : state(FACET_CHAIN_OPEN) {}
        Contextual(Contextual&& other) noexcept : state(other.state) { other.state = FACET_CHAIN_SUPERSEDED; }
        Contextual(const Contextual&) = delete;
        Contextual& operator=(const Contextual&) = delete;

        int getState() const { return state; }
        bool isOpen() const { return state == FACET_CHAIN_OPEN; }

    protected:
        virtual const C& getContext() const = 0;

        void checkOpen() const
        {
            if (state != FACET_CHAIN_OPEN)
                reportClosedChain(state);
        }

        //! Runs one chain step; a throwing step fails the carrier and propagates.
        template <typename F>
        void step(F&& fn)
        {
            checkOpen();
            try {
                fn();
            } catch (...) {
                state = FACET_CHAIN_FAILED;
                throw;
            }
        }

        //! Terminates the chain and reads the final context.
        template <typename F>
        auto finish(F&& fn) -> decltype(fn(std::declval<const C&>()))
        {
            checkOpen();
            state = FACET_CHAIN_TERMINATED;
            return fn(getContext());
        }

        void supersede() { state = FACET_CHAIN_SUPERSEDED; }

    private:
        int state;
    };

    /**
     * @brief General purpose carrier over a context value.
     */
    template <typename C>
    class ContextCarrier : public Contextual<C>
    {
    public:
        explicit ContextCarrier(C context) : context(std::move(context)) {}
        ContextCarrier(ContextCarrier&&) = default;

        //! Applies \a fn to the context in place and returns this carrier.
        template <typename F>
        ContextCarrier& chain(F&& fn)
        {
            this->step([&] { fn(context); });
            return *this;
        }

        //! Moves the context through \a fn into a new carrier; this one is spent.
        template <typename F>
        auto derive(F&& fn) -> ContextCarrier<typename std::decay<decltype(fn(std::declval<C&&>()))>::type>
        {
            typedef typename std::decay<decltype(fn(std::declval<C&&>()))>::type D;
            this->checkOpen();
            std::optional<D> next;
            this->step([&] { next.emplace(fn(std::move(context))); });
            this->supersede();
            return ContextCarrier<D>(std::move(*next));
        }

        template <typename F>
        auto subject(F&& fn) -> decltype(fn(std::declval<const C&>()))
        {
            return this->finish(std::forward<F>(fn));
        }

    protected:
        const C& getContext() const override { return context; }

    private:
        C context;
    };

    /**
     * @brief Arithmetic chain over an operable context.
     *
     * plus/minus/times/by accumulate in place; locked() and unlocked() replace the
     * context with a fixed or free copy of the current value; total() ends the chain.
     */
    template <typename T>
    class Tally : public Contextual<Operable<T>>
    {
    public:
        explicit Tally(std::unique_ptr<Operable<T>> value) : value(std::move(value))
        {
            if (!this->value)
                reportMissingOperand("tally");
        }

        Tally(Tally&&) = default;

        static Tally from(T start) { return Tally(std::make_unique<FreeValue<T>>(std::move(start))); }
        static Tally fixed(T start) { return Tally(std::make_unique<LockedValue<T>>(std::move(start))); }

        Tally& plus(const std::optional<T>& operand) { this->step([&] { value->add(operand); }); return *this; }
        Tally& minus(const std::optional<T>& operand) { this->step([&] { value->subtract(operand); }); return *this; }
        Tally& times(const std::optional<T>& operand) { this->step([&] { value->multiply(operand); }); return *this; }
        Tally& by(const std::optional<T>& operand) { this->step([&] { value->divide(operand); }); return *this; }

        Tally locked()
        {
            this->checkOpen();
            this->supersede();
            return fixed(value->getValue());
        }

        Tally unlocked()
        {
            this->checkOpen();
            this->supersede();
            return from(value->getValue());
        }

        T total()
        {
            return this->finish([](const Operable<T>& v) { return v.getValue(); });
        }

    protected:
        const Operable<T>& getContext() const override { return *value; }

    private:
        std::unique_ptr<Operable<T>> value;
    };
}

#endif /* FACET_H_ */
