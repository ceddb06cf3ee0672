#pragma once

#include <QString>

#include <memory>
#include <vector>

class Mapper;

enum class ActionState {
    Created,
    Executing,
    Executed,
    Failed
};

/**
 * A reversible edit of the map.
 *
 * An action is built from its options and performed once. A successful perform() returns a new
 * action that undoes exactly what was done; a failed one returns null and leaves the action in the
 * Failed state. Nothing is rolled back automatically; see takePartialInverse().
 */
class Action {
public:
    explicit Action(Mapper* mapper);
    virtual ~Action();

    Action(const Action&) = delete;
    Action& operator=(const Action&) = delete;

    std::unique_ptr<Action> perform(QString* errorMessage = nullptr);

    ActionState state() const { return m_state; }
    Mapper* mapper() const { return m_mapper; }

    // True when performing would change nothing.
    virtual bool empty() const { return false; }
    virtual QString label() const = 0;

    // After a failure: the action undoing the part that did run, or null when nothing ran.
    virtual std::unique_ptr<Action> takePartialInverse();

protected:
    // Returns the inverse, or null on failure.
    virtual std::unique_ptr<Action> execute(QString* errorMessage) = 0;

    Mapper* m_mapper = nullptr;

private:
    ActionState m_state = ActionState::Created;
};

using ActionList = std::vector<std::unique_ptr<Action>>;

class BulkAction : public Action {
public:
    explicit BulkAction(Mapper* mapper, ActionList actions = ActionList(), const QString& label = QString());

    void append(std::unique_ptr<Action> action);
    const ActionList& actions() const { return m_actions; }

    bool empty() const override;
    QString label() const override;
    std::unique_ptr<Action> takePartialInverse() override;

protected:
    std::unique_ptr<Action> execute(QString* errorMessage) override;

private:
    ActionList m_actions;
    QString m_label;
    std::unique_ptr<Action> m_partialInverse;
};
