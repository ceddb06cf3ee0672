#include "Action.h"

#include "app/LogCategories.h"

Action::Action(Mapper* mapper)
    : m_mapper(mapper) {}

Action::~Action() = default;

std::unique_ptr<Action> Action::perform(QString* errorMessage) {
    if (m_state != ActionState::Created) {
        if (errorMessage) {
            *errorMessage = QStringLiteral("%1 was already performed").arg(label());
        }
        qCWarning(lcActions) << "Refusing to perform" << label() << "twice";
        return nullptr;
    }

    m_state = ActionState::Executing;
    QString error;
    std::unique_ptr<Action> inverse = execute(&error);
    if (!inverse) {
        m_state = ActionState::Failed;
        if (error.isEmpty()) {
            error = QStringLiteral("%1 failed").arg(label());
        }
        qCWarning(lcActions).noquote() << "Action failed:" << error;
        if (errorMessage) {
            *errorMessage = error;
        }
        return nullptr;
    }

    m_state = ActionState::Executed;
    qCDebug(lcActions) << "Performed" << label();
    return inverse;
}

std::unique_ptr<Action> Action::takePartialInverse() {
    return nullptr;
}

BulkAction::BulkAction(Mapper* mapper, ActionList actions, const QString& label)
    : Action(mapper),
      m_actions(std::move(actions)),
      m_label(label) {}

void BulkAction::append(std::unique_ptr<Action> action) {
    if (action) {
        m_actions.push_back(std::move(action));
    }
}

bool BulkAction::empty() const {
    for (const std::unique_ptr<Action>& action : m_actions) {
        if (!action->empty()) {
            return false;
        }
    }
    return true;
}

QString BulkAction::label() const {
    return m_label.isEmpty() ? QStringLiteral("Bulk Edit") : m_label;
}

std::unique_ptr<Action> BulkAction::takePartialInverse() {
    return std::move(m_partialInverse);
}

std::unique_ptr<Action> BulkAction::execute(QString* errorMessage) {
    ActionList inverses;
    inverses.reserve(m_actions.size());

    for (const std::unique_ptr<Action>& action : m_actions) {
        QString error;
        std::unique_ptr<Action> inverse = action->perform(&error);
        if (inverse) {
            inverses.push_back(std::move(inverse));
            continue;
        }

        // Undo order for what ran: the failed action's own leftovers first, then the others reversed.
        ActionList partial;
        if (std::unique_ptr<Action> leftover = action->takePartialInverse()) {
            partial.push_back(std::move(leftover));
        }
        for (auto it = inverses.rbegin(); it != inverses.rend(); ++it) {
            partial.push_back(std::move(*it));
        }
        if (!partial.empty()) {
            m_partialInverse = std::make_unique<BulkAction>(m_mapper, std::move(partial), label());
        }
        if (errorMessage) {
            *errorMessage = QStringLiteral("%1: %2").arg(label(), error);
        }
        return nullptr;
    }

    ActionList reversed;
    reversed.reserve(inverses.size());
    for (auto it = inverses.rbegin(); it != inverses.rend(); ++it) {
        reversed.push_back(std::move(*it));
    }
    return std::make_unique<BulkAction>(m_mapper, std::move(reversed), label());
}
