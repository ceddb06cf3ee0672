#include "ActionCommand.h"

#include "actions/Action.h"
#include "app/LogCategories.h"
#include "app/Mapper.h"

ActionCommand::ActionCommand(Mapper* mapper,
                             std::unique_ptr<Action> undoAction,
                             const QString& text,
                             bool alreadyApplied,
                             QUndoCommand* parent)
    : QUndoCommand(text, parent),
      m_mapper(mapper),
      m_undoAction(std::move(undoAction)),
      m_alreadyApplied(alreadyApplied) {}

ActionCommand::~ActionCommand() = default;

void ActionCommand::undo() {
    if (!m_mapper || !m_undoAction) {
        return;
    }
    QString error;
    std::unique_ptr<Action> redoAction = m_mapper->performAction(*m_undoAction, &error);
    if (!redoAction) {
        qCWarning(lcActions).noquote() << "Undo of" << text() << "failed:" << error;
        setObsolete(true);
        return;
    }
    m_undoAction.reset();
    m_redoAction = std::move(redoAction);
}

void ActionCommand::redo() {
    if (m_firstRedo && m_alreadyApplied) {
        m_firstRedo = false;
        return;
    }
    m_firstRedo = false;
    if (!m_mapper || !m_redoAction) {
        return;
    }
    QString error;
    std::unique_ptr<Action> undoAction = m_mapper->performAction(*m_redoAction, &error);
    if (!undoAction) {
        qCWarning(lcActions).noquote() << "Redo of" << text() << "failed:" << error;
        setObsolete(true);
        return;
    }
    m_redoAction.reset();
    m_undoAction = std::move(undoAction);
}
