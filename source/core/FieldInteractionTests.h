#ifndef FIELDINTERACTIONTESTS_H
#define FIELDINTERACTIONTESTS_H

#include <QObject>
#include <QTest>
#include <QSignalSpy>
#include "FieldInteraction.h"
#include "PageFieldList.h"

/**
 * Unit tests for the field editing state machine.
 * Run with: pdfformbuilder --test-interaction
 *
 * All tests use a US Letter page (612 x 792 pt) rendered at zoom 1.25,
 * so 1 pt = 1.25 px.
 */
class FieldInteractionTests : public QObject {
    Q_OBJECT

private:
    static PageMetrics letter() { return PageMetrics(612, 792); }
    static CoordinateMapper letterMapper() { return CoordinateMapper(letter(), QSizeF(765, 990)); }

    static bool fitsInPage(const FormField& field) {
        return field.x >= 0 && field.y >= 0 &&
               field.x + field.width <= 612 + 1e-9 &&
               field.y + field.height <= 792 + 1e-9;
    }

    static FormField textField(qreal x, qreal y) {
        FormField field;
        field.type = FieldType::Text;
        field.x = x;
        field.y = y;
        field.width = 140;
        field.height = 24;
        return field;
    }

    static FormField checkbox(qreal x, qreal y) {
        FormField field;
        field.type = FieldType::Checkbox;
        field.x = x;
        field.y = y;
        field.width = 18;
        field.height = 18;
        return field;
    }

private slots:
    void testPlaceTextField() {
        PageFieldList list(0, letter());
        FieldInteraction interaction;
        interaction.setPage(&list, letterMapper());
        interaction.setPlacementType(FieldType::Text);
        QCOMPARE(interaction.state(), FieldInteraction::State::Placing);

        QSignalSpy changed(&interaction, &FieldInteraction::fieldsChanged);
        QSignalSpy created(&interaction, &FieldInteraction::fieldCreated);
        QSignalSpy finished(&interaction, &FieldInteraction::placementFinished);

        interaction.pointerPress(QPointF(100, 100));

        QCOMPARE(list.count(), 1);
        const FormField& field = list.at(0);
        QCOMPARE(field.type, FieldType::Text);
        QCOMPARE(field.x, 80.0);
        QCOMPARE(field.y, 688.0);   // 792 - 100 / 1.25 - 24
        QCOMPARE(field.width, 140.0);
        QCOMPARE(field.height, 24.0);
        QCOMPARE(*field.page, 0);

        QCOMPARE(changed.count(), 1);
        QCOMPARE(created.count(), 1);
        QCOMPARE(finished.count(), 1);
        QCOMPARE(interaction.selectedIndex(), 0);
        QCOMPARE(interaction.state(), FieldInteraction::State::Selected);
        QVERIFY(!interaction.placementType().has_value());
    }

    void testPlaceCheckboxAtEdgeIsClamped() {
        PageFieldList list(0, letter());
        FieldInteraction interaction;
        interaction.setPage(&list, letterMapper());
        interaction.setPlacementType(FieldType::Checkbox);

        interaction.pointerPress(QPointF(764, 989));

        QCOMPARE(list.count(), 1);
        QVERIFY(fitsInPage(list.at(0)));
        QCOMPARE(list.at(0).width, 18.0);
        QCOMPARE(list.at(0).height, 18.0);
        QCOMPARE(list.at(0).y, 0.0);
    }

    void testOverlapSelectsLaterField() {
        PageFieldList list(0, letter());
        list.append(textField(80, 688));
        list.append(textField(100, 680));
        FieldInteraction interaction;
        interaction.setPage(&list, letterMapper());

        QSignalSpy selection(&interaction, &FieldInteraction::selectionChanged);

        // Inside both rectangles
        interaction.pointerPress(QPointF(150, 120));
        QCOMPARE(interaction.selectedIndex(), 1);
        QCOMPARE(selection.count(), 1);
        QCOMPARE(selection.takeFirst().at(0).toInt(), 1);
        interaction.pointerRelease(QPointF(150, 120));

        // Only in the first one
        interaction.pointerPress(QPointF(101, 101));
        QCOMPARE(interaction.selectedIndex(), 0);
        interaction.pointerRelease(QPointF(101, 101));
    }

    void testPressOnEmptyAreaClearsSelection() {
        PageFieldList list(0, letter());
        list.append(textField(80, 688));
        FieldInteraction interaction;
        interaction.setPage(&list, letterMapper());

        interaction.pointerPress(QPointF(110, 110));
        interaction.pointerRelease(QPointF(110, 110));
        QCOMPARE(interaction.selectedIndex(), 0);
        QCOMPARE(interaction.state(), FieldInteraction::State::Selected);

        QSignalSpy selection(&interaction, &FieldInteraction::selectionChanged);
        interaction.pointerPress(QPointF(600, 600));
        QCOMPARE(interaction.selectedIndex(), -1);
        QCOMPARE(interaction.state(), FieldInteraction::State::Idle);
        QCOMPARE(selection.count(), 1);
        QCOMPARE(selection.takeFirst().at(0).toInt(), -1);
    }

    void testDragKeepsFieldInPage() {
        PageFieldList list(0, letter());
        list.append(textField(80, 688));
        FieldInteraction interaction;
        interaction.setPage(&list, letterMapper());
        QSignalSpy changed(&interaction, &FieldInteraction::fieldsChanged);

        interaction.pointerPress(QPointF(110, 110));
        QCOMPARE(interaction.state(), FieldInteraction::State::Dragging);

        // Plain move: 25 px right and down = 20 pt
        interaction.pointerMove(QPointF(135, 135));
        QCOMPARE(list.at(0).x, 100.0);
        QCOMPARE(list.at(0).y, 668.0);

        interaction.pointerMove(QPointF(-500, -500));
        QCOMPARE(list.at(0).x, 0.0);
        QCOMPARE(list.at(0).y, 768.0);
        QVERIFY(fitsInPage(list.at(0)));

        interaction.pointerMove(QPointF(5000, 5000));
        QCOMPARE(list.at(0).x, 472.0);
        QCOMPARE(list.at(0).y, 0.0);
        QVERIFY(fitsInPage(list.at(0)));

        QCOMPARE(changed.count(), 3);

        interaction.pointerRelease(QPointF(5000, 5000));
        QCOMPARE(interaction.state(), FieldInteraction::State::Selected);
        QCOMPARE(interaction.selectedIndex(), 0);

        // Moves after release do nothing
        interaction.pointerMove(QPointF(200, 200));
        QCOMPARE(list.at(0).x, 472.0);
        QCOMPARE(changed.count(), 3);
    }

    void testResizeCheckboxStaysSquare() {
        PageFieldList list(0, letter());
        list.append(checkbox(100, 100));
        FieldInteraction interaction;
        interaction.setPage(&list, letterMapper());
        interaction.select(0);

        // Pixel rect: (125, 842.5) 22.5 x 22.5, handle centred on (147.5, 865)
        interaction.pointerPress(QPointF(147.5, 865));
        QCOMPARE(interaction.state(), FieldInteraction::State::Resizing);

        interaction.pointerMove(QPointF(197.5, 875));   // +40 pt, +8 pt
        QCOMPARE(list.at(0).width, 58.0);
        QCOMPARE(list.at(0).height, 58.0);
        QCOMPARE(list.at(0).x, 100.0);
        QCOMPARE(list.at(0).y, 100.0);

        interaction.pointerMove(QPointF(5000, 5000));
        QCOMPARE(list.at(0).width, list.at(0).height);
        QVERIFY(fitsInPage(list.at(0)));
        QCOMPARE(list.at(0).width, 512.0);

        interaction.pointerMove(QPointF(-5000, -5000));
        QCOMPARE(list.at(0).width, list.at(0).height);
        QCOMPARE(list.at(0).width, 5.6);   // 7 px at 1.25 px/pt

        interaction.pointerRelease(QPointF(-5000, -5000));
        QCOMPARE(interaction.state(), FieldInteraction::State::Selected);
    }

    void testResizeTextFieldIndependentAxes() {
        PageFieldList list(0, letter());
        list.append(textField(80, 688));
        FieldInteraction interaction;
        interaction.setPage(&list, letterMapper());
        interaction.select(0);

        // Handle centred on the bottom-right pixel corner (275, 130);
        // pressing its outer half still resizes
        interaction.pointerPress(QPointF(278, 133));
        QCOMPARE(interaction.state(), FieldInteraction::State::Resizing);

        interaction.pointerMove(QPointF(303, 128));   // +20 pt wide, -4 pt tall
        QCOMPARE(list.at(0).width, 160.0);
        QCOMPARE(list.at(0).height, 20.0);
        QVERIFY(fitsInPage(list.at(0)));

        interaction.pointerMove(QPointF(5000, 5000));
        QCOMPARE(list.at(0).width, 532.0);   // 612 - 80
        QCOMPARE(list.at(0).height, 104.0);  // 792 - 688
    }

    void testDuplicateNearTopRightStaysInPage() {
        PageFieldList list(0, letter());
        FormField original = textField(472, 768);
        original.name = "text_1";
        original.defaultValue = "abc";
        list.append(original);
        FieldInteraction interaction;
        interaction.setPage(&list, letterMapper());
        interaction.select(0);

        QSignalSpy changed(&interaction, &FieldInteraction::fieldsChanged);
        QVERIFY(interaction.duplicateSelected());

        QCOMPARE(list.count(), 2);
        QCOMPARE(interaction.selectedIndex(), 1);
        QCOMPARE(changed.count(), 1);

        const FormField& copy = list.at(1);
        QVERIFY(copy.name.isEmpty());
        QCOMPARE(copy.defaultValue, QString("abc"));
        QVERIFY(fitsInPage(copy));
        QCOMPARE(copy.x, 472.0);
        QCOMPARE(copy.y, 768.0);
    }

    void testDuplicateOffsetsByTwelvePoints() {
        PageFieldList list(0, letter());
        list.append(checkbox(100, 100));
        FieldInteraction interaction;
        interaction.setPage(&list, letterMapper());
        interaction.select(0);

        QVERIFY(interaction.duplicateSelected());
        QCOMPARE(list.at(1).x, 112.0);
        QCOMPARE(list.at(1).y, 112.0);
        QCOMPARE(list.at(1).type, FieldType::Checkbox);
    }

    void testCommandsWithoutSelection() {
        PageFieldList list(0, letter());
        list.append(textField(80, 688));
        FieldInteraction interaction;
        interaction.setPage(&list, letterMapper());

        QSignalSpy changed(&interaction, &FieldInteraction::fieldsChanged);
        QVERIFY(!interaction.deleteSelected());
        QVERIFY(!interaction.duplicateSelected());
        QCOMPARE(list.count(), 1);
        QCOMPARE(changed.count(), 0);

        // Unbound machine ignores everything
        FieldInteraction unbound;
        unbound.pointerPress(QPointF(10, 10));
        QVERIFY(!unbound.deleteSelected());
        QCOMPARE(unbound.selectedIndex(), -1);
    }

    void testDeleteSelected() {
        PageFieldList list(0, letter());
        list.append(textField(80, 688));
        list.append(checkbox(300, 300));
        FieldInteraction interaction;
        interaction.setPage(&list, letterMapper());
        interaction.select(1);

        QSignalSpy selection(&interaction, &FieldInteraction::selectionChanged);
        QSignalSpy changed(&interaction, &FieldInteraction::fieldsChanged);
        QVERIFY(interaction.deleteSelected());

        QCOMPARE(list.count(), 1);
        QCOMPARE(list.at(0).type, FieldType::Text);
        QCOMPARE(interaction.selectedIndex(), -1);
        QCOMPARE(selection.count(), 1);
        QCOMPARE(changed.count(), 1);
        QCOMPARE(interaction.state(), FieldInteraction::State::Idle);
    }

    void testPlacementSurvivesPageSwitch() {
        PageFieldList first(0, letter());
        PageFieldList second(1, letter());
        first.append(textField(80, 688));
        FieldInteraction interaction;
        interaction.setPage(&first, letterMapper());
        interaction.select(0);

        interaction.setPlacementType(FieldType::Checkbox);
        QCOMPARE(interaction.selectedIndex(), -1);

        interaction.setPage(&second, letterMapper());
        QCOMPARE(interaction.state(), FieldInteraction::State::Placing);
        QCOMPARE(*interaction.placementType(), FieldType::Checkbox);

        interaction.pointerPress(QPointF(50, 50));
        QCOMPARE(second.count(), 1);
        QCOMPARE(*second.at(0).page, 1);
        QCOMPARE(first.count(), 1);
    }

    void testExplicitSelectEndsPlacement() {
        PageFieldList list(0, letter());
        list.append(textField(80, 688));
        FieldInteraction interaction;
        interaction.setPage(&list, letterMapper());
        interaction.setPlacementType(FieldType::Text);

        QSignalSpy finished(&interaction, &FieldInteraction::placementFinished);
        interaction.select(0);
        QCOMPARE(finished.count(), 1);
        QVERIFY(!interaction.placementType().has_value());
        QCOMPARE(interaction.state(), FieldInteraction::State::Selected);
    }
};

#endif // FIELDINTERACTIONTESTS_H
